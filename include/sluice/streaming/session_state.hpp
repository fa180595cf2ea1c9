#pragma once

namespace sluice
{

// ============================================================================
// Stream Session State Pattern
// ============================================================================
//
//   created -> pulling <-> backpressure_wait
//              pulling -> emitting -> pulling | finalizing -> closed
//   any state -> closed on cancellation or upstream error

class stream_state
{
public:
    virtual ~stream_state() = default;
    virtual const char* name() const = 0;
    virtual bool can_read_upstream() const = 0;
    virtual bool is_terminal() const { return false; }
};

class created_state : public stream_state
{
public:
    const char* name() const override { return "created"; }
    bool can_read_upstream() const override { return true; }
};

class pulling_state : public stream_state
{
public:
    const char* name() const override { return "pulling"; }
    bool can_read_upstream() const override { return false; }
};

class backpressure_wait_state : public stream_state
{
public:
    const char* name() const override { return "backpressure_wait"; }
    bool can_read_upstream() const override { return true; }
};

class emitting_state : public stream_state
{
public:
    const char* name() const override { return "emitting"; }
    bool can_read_upstream() const override { return true; }
};

class finalizing_state : public stream_state
{
public:
    const char* name() const override { return "finalizing"; }
    bool can_read_upstream() const override { return false; }
};

class closed_state : public stream_state
{
public:
    const char* name() const override { return "closed"; }
    bool can_read_upstream() const override { return false; }
    bool is_terminal() const override { return true; }
};

} // namespace sluice
