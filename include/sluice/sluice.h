#pragma once

#include "sluice/logger.h"
#include "sluice/version.hpp"

#include "sluice/streaming/stream_manager.hpp"

#ifdef SLUICE_WITH_MONITORING
    #include "sluice/monitoring/stream_metrics_exporter.hpp"
#endif
