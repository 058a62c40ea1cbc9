#pragma once

#include <coroutine>
#include <cstdint>
#include <cstdio>
#include <exception>

namespace xfer
{
class IoContext;
// -----------------------------------------------------------------------------
// Operation State (Intrusive Tracking)
// -----------------------------------------------------------------------------

/**
 * Base state for every suspended operation, kernel-backed or not.
 *
 * Linked into the IoContext pending list on submission and unlinked on
 * completion. Operations finished by another thread (the blocking pool, a
 * carrier of the lightweight pool) come back through
 * IoContext::EnqueueExternalDone and are unlinked on the loop thread.
 *
 * Destroying a still-linked state terminates the process: the frame that
 * holds it is about to be freed while someone may still write into it.
 *
 * Movable only while untracked (before await_suspend).
 */
struct OperationState
{
    IoContext* ctx = nullptr;
    int32_t res = 0;
    std::coroutine_handle<> handle;

    // Intrusive doubly linked list pointers
    OperationState* next = nullptr;
    OperationState* prev = nullptr;
    bool tracked = false;

    OperationState() = default;

    OperationState(OperationState&& other) noexcept : ctx(other.ctx), res(other.res), handle(other.handle)
    {
        if (other.tracked)
        {
            std::fprintf(stderr,
                         "[xfer] FATAL: moved an OperationState that is tracked by an IoContext.\n"
                         "[xfer]        A Task was moved while suspended.\n");
            std::terminate();
        }
        other.ctx = nullptr;
        other.handle = nullptr;
    }

    OperationState& operator=(OperationState&&) = delete;
    OperationState(const OperationState&) = delete;
    OperationState& operator=(const OperationState&) = delete;

    ~OperationState()
    {
        if (tracked)
        {
            std::fprintf(stderr,
                         "[xfer] FATAL: OperationState destroyed while still pending.\n"
                         "[xfer]        Keep the owning Task alive (e.g. in a TaskGroup) until it completes.\n");
            std::terminate();
        }
    }
};
}  // namespace xfer
