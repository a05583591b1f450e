#pragma once

#include <coroutine>
#include <exception>
#include <optional>
#include <utility>

namespace zcio
{
// -----------------------------------------------------------------------------
// Task<T> - lazily started coroutine, resumes its awaiter on completion
// -----------------------------------------------------------------------------

template <typename T>
class Task;

namespace detail
{

struct PromiseBase
{
    std::exception_ptr exception;
    std::coroutine_handle<> continuation;

    std::suspend_always initial_suspend() noexcept { return {}; }

    struct FinalAwaiter
    {
        bool await_ready() noexcept { return false; }

        template <typename Promise>
        std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> h) noexcept
        {
            if (h.promise().continuation != nullptr)
            {
                return h.promise().continuation;
            }
            return std::noop_coroutine();
        }

        void await_resume() noexcept {}
    };

    FinalAwaiter final_suspend() noexcept { return {}; }
    void unhandled_exception() { exception = std::current_exception(); }

    void RethrowIfFailed() const
    {
        if (exception)
        {
            std::rethrow_exception(exception);
        }
    }
};

template <typename T>
struct Promise : PromiseBase
{
    std::optional<T> value;

    Task<T> get_return_object();
    void return_value(T v) { value = std::move(v); }

    T Take()
    {
        RethrowIfFailed();
        return std::move(*value);
    }
};

template <>
struct Promise<void> : PromiseBase
{
    Task<void> get_return_object();
    void return_void() {}

    void Take() const { RethrowIfFailed(); }
};

}  // namespace detail

template <typename T = void>
class [[nodiscard("You must co_await a Task or keep it alive")]] Task
{
public:
    using promise_type = detail::Promise<T>;
    using handle_type = std::coroutine_handle<promise_type>;

    explicit Task(handle_type h) : handle_(h) {}
    Task(Task&& other) noexcept : handle_(std::exchange(other.handle_, {})) {}
    Task& operator=(Task&& other) noexcept
    {
        if (this != &other)
        {
            Destroy();
            handle_ = std::exchange(other.handle_, {});
        }
        return *this;
    }

    ~Task() { Destroy(); }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    bool Done() const { return handle_ && handle_.done(); }

    /// Value of a finished task; rethrows an exception escaping the body.
    T Result() { return handle_.promise().Take(); }

    void resume()
    {
        if (handle_ && !handle_.done())
        {
            handle_.resume();
        }
    }

    // Runs the task up to its first suspension point. Keep the Task alive!
    void Start() { resume(); }

    bool await_ready() const noexcept { return false; }

    std::coroutine_handle<> await_suspend(std::coroutine_handle<> cont) noexcept
    {
        handle_.promise().continuation = cont;
        return handle_;
    }

    T await_resume() { return handle_.promise().Take(); }

private:
    void Destroy()
    {
        if (handle_)
        {
            handle_.destroy();
            handle_ = {};
        }
    }

    handle_type handle_;
};

namespace detail
{
template <typename T>
Task<T> Promise<T>::get_return_object()
{
    return Task<T>{std::coroutine_handle<Promise>::from_promise(*this)};
}

inline Task<void> Promise<void>::get_return_object()
{
    return Task<void>{std::coroutine_handle<Promise>::from_promise(*this)};
}
}  // namespace detail

}  // namespace zcio
