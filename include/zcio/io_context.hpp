#pragma once

/**
 * io_context.hpp - Single-threaded cooperative scheduler on io_uring
 *
 * The transfer layer only needs one capability from a scheduler: suspend the
 * current coroutine until a descriptor is ready, without blocking the thread.
 * IoContext provides it by submitting poll requests to io_uring and resuming
 * the waiting coroutine from the completion queue.
 *
 * Design:
 * - One IoContext per thread, no cross-thread submission
 * - Operation state pointer stored in user_data for direct resume
 * - Intrusive tracking of pending submissions for cancellation on shutdown
 *
 * !! IMPORTANT !!
 * Operation state is embedded in coroutine frames. Destroying a Task while it
 * is suspended on a pending submission terminates the process.
 *
 * Requirements:
 * - Linux kernel >= 6.1 (IORING_SETUP_DEFER_TASKRUN)
 * - liburing
 */

#include <atomic>
#include <coroutine>
#include <cstdio>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

#include <liburing.h>

#include "zcio/operation_base.hpp"
#include "zcio/result.hpp"
#include "zcio/task.hpp"

namespace zcio
{

class IoContext
{
#ifndef NDEBUG
    std::thread::id owner_thread_ = std::this_thread::get_id();
#endif

    void AssertOwnerThread() const
    {
#ifndef NDEBUG
        if (std::this_thread::get_id() != owner_thread_)
        {
            std::fprintf(stderr, "IoContext accessed from wrong thread!\n");
            std::terminate();
        }
#endif
    }

public:
    explicit IoContext(const unsigned entries = 64)
    {
        io_uring_params params{};
        params.flags |= IORING_SETUP_COOP_TASKRUN | IORING_SETUP_SINGLE_ISSUER | IORING_SETUP_DEFER_TASKRUN;

        if (const int ret = io_uring_queue_init_params(entries, &ring_, &params); ret < 0)
        {
            throw std::system_error(-ret, std::system_category(), "io_uring_queue_init_params");
        }

        ready_.reserve(entries);
    }

    ~IoContext() noexcept
    {
        CancelAllPending();
        io_uring_queue_exit(&ring_);
    }

    IoContext(const IoContext&) = delete;
    IoContext& operator=(const IoContext&) = delete;

    // -------------------------------------------------------------------------
    // Operation Tracking
    // -------------------------------------------------------------------------

    void Track(OperationState* op)
    {
        AssertOwnerThread();

        op->tracked = true;
        op->next = pending_head_;
        op->prev = nullptr;
        if (pending_head_ != nullptr)
        {
            pending_head_->prev = op;
        }
        pending_head_ = op;
    }

    void Untrack(OperationState* op)
    {
        AssertOwnerThread();

        if (op->prev != nullptr)
        {
            op->prev->next = op->next;
        }
        else if (pending_head_ == op)
        {
            pending_head_ = op->next;
        }
        if (op->next != nullptr)
        {
            op->next->prev = op->prev;
        }
        op->next = nullptr;
        op->prev = nullptr;
        op->tracked = false;
    }

    /**
     * Cancel all pending submissions and drain their completions.
     * Called automatically on destruction. Does NOT resume coroutines.
     */
    void CancelAllPending()
    {
        for (const auto* op = pending_head_; op; op = op->next)
        {
            io_uring_sqe* sqe = io_uring_get_sqe(&ring_);
            if (sqe == nullptr)
            {
                io_uring_submit(&ring_);
                sqe = io_uring_get_sqe(&ring_);
                if (sqe == nullptr)
                {
                    break;
                }
            }
            io_uring_prep_cancel(sqe, op, 0);
            io_uring_sqe_set_data(sqe, nullptr);
        }
        io_uring_submit(&ring_);

        DrainWithoutResume();
    }

    // -------------------------------------------------------------------------
    // Event Loop
    // -------------------------------------------------------------------------

    template <typename T>
    void RunUntilDone(Task<T>& t)
    {
        AssertOwnerThread();

        running_ = true;
        t.resume();
        while (running_ && !t.Done())
        {
            Step();
        }
    }

    /// Runs until Stop(); tick() is invoked after every batch of completions.
    template <typename Tick>
    void Run(Tick&& tick)
    {
        AssertOwnerThread();

        running_ = true;
        while (running_)
        {
            Step();
            tick();
        }
    }

    void Stop() { running_ = false; }

    // -------------------------------------------------------------------------
    // Low-level Access
    // -------------------------------------------------------------------------

    void EnsureSqes(const unsigned n)
    {
        AssertOwnerThread();

        if (io_uring_sq_space_left(&ring_) < n)
        {
            io_uring_submit(&ring_);

            if (io_uring_sq_space_left(&ring_) < n)
            {
                throw std::runtime_error("SQ full after submit");
            }
        }
    }

    io_uring_sqe* GetSqe()
    {
        AssertOwnerThread();

        return io_uring_get_sqe(&ring_);
    }

private:
    void DrainWithoutResume()
    {
        while (pending_head_ != nullptr)
        {
            io_uring_cqe* cqe = nullptr;
            int ret = 0;
            do
            {
                ret = io_uring_wait_cqe(&ring_, &cqe);
            } while (ret == -EINTR);

            if (ret < 0)
            {
                break;
            }

            if (const auto ud = io_uring_cqe_get_data64(cqe); ud != 0)
            {
                auto* op = reinterpret_cast<OperationState*>(static_cast<uintptr_t>(ud));
                Untrack(op);
            }
            io_uring_cqe_seen(&ring_, cqe);
        }
    }

    void Step()
    {
        int ret = 0;
        do
        {
            ret = io_uring_submit_and_wait(&ring_, 1);
        } while (ret == -EINTR);

        if (ret < 0)
        {
            // Nothing is recoverable here; a later Step retries the wait.
            return;
        }

        ready_.clear();
        ProcessReadyCompletions();

        // Resume outside CQE iteration (flat, no stack growth)
        for (auto h : ready_)
        {
            if (h && !h.done())
            {
                h.resume();
            }
        }
    }

    unsigned ProcessReadyCompletions()
    {
        io_uring_cqe* cqe = nullptr;
        unsigned head = 0;
        unsigned count = 0;

        io_uring_for_each_cqe(&ring_, head, cqe)
        {
            count++;
            const auto user_data = io_uring_cqe_get_data64(cqe);
            if (user_data == 0)
            {
                continue;
            }

            auto* op = reinterpret_cast<OperationState*>(static_cast<uintptr_t>(user_data));
            Untrack(op);
            op->res = cqe->res;
            ready_.push_back(op->handle);
        }

        io_uring_cq_advance(&ring_, count);
        return count;
    }

    io_uring ring_{};
    std::vector<std::coroutine_handle<>> ready_;
    OperationState* pending_head_ = nullptr;
    std::atomic<bool> running_ = false;
};

// -----------------------------------------------------------------------------
// Base for single-submission awaitables (explicit object parameter)
// -----------------------------------------------------------------------------

struct UringOp : OperationState
{
protected:
    explicit UringOp(IoContext* c) { ctx = c; }

    UringOp(UringOp&&) = default;

public:
    bool await_ready() const noexcept { return false; }

    void await_suspend(this auto& self, std::coroutine_handle<> h)
    {
        self.handle = h;
        auto* op = static_cast<OperationState*>(&self);
        self.ctx->EnsureSqes(1);
        self.ctx->Track(op);
        auto* sqe = self.ctx->GetSqe();
        self.PrepareSqe(sqe);
        io_uring_sqe_set_data(sqe, op);
    }

    Result<size_t> await_resume()
    {
        if (res < 0)
        {
            return std::unexpected(MakeErrorCode(res));
        }
        return static_cast<size_t>(res);
    }
};

}  // namespace zcio
