#pragma once

#include <coroutine>
#include <exception>
#include <optional>
#include <utility>

namespace xfer
{
// -----------------------------------------------------------------------------
// Task<T> - lazily started coroutine with a single awaiting continuation
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
            // Symmetric transfer back to whoever awaited us, if anyone.
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
    using value_type = T;

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

    ~Task() noexcept { Destroy(); }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    bool Done() const { return handle_ && handle_.done(); }

    /// Result of a finished task; rethrows the exception it ended with.
    T Result() { return handle_.promise().Take(); }

    void resume()
    {
        if (handle_ && !handle_.done())
        {
            handle_.resume();
        }
    }

    // Starts the task without awaiting it. The Task object must stay alive
    // until Done() is true.
    void Start() { resume(); }

    bool await_ready() const noexcept { return false; }

    std::coroutine_handle<> await_suspend(std::coroutine_handle<> cont) noexcept
    {
        handle_.promise().continuation = cont;
        return handle_;
    }

    T await_resume() { return handle_.promise().Take(); }

private:
    void Destroy() noexcept
    {
        if (handle_ != nullptr)
        {
            handle_.destroy();
            handle_ = nullptr;
        }
    }

    handle_type handle_;
};

namespace detail
{

template <typename T>
Task<T> Promise<T>::get_return_object()
{
    return Task<T>{std::coroutine_handle<Promise<T>>::from_promise(*this)};
}

inline Task<void> Promise<void>::get_return_object()
{
    return Task<void>{std::coroutine_handle<Promise<void>>::from_promise(*this)};
}

template <typename>
struct TaskValue;

template <typename T>
struct TaskValue<Task<T>>
{
    using type = T;
};

}  // namespace detail

/// Value type produced by a Task type, e.g. TaskValueT<Task<int>> is int.
template <typename TaskT>
using TaskValueT = typename detail::TaskValue<TaskT>::type;

}  // namespace xfer
