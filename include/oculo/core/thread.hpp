#pragma once

#include <stop_token>
#include <thread>

namespace oculo::core {

// CRTP worker loop. Derived provides Init(), Run() and Shutdown(); Run() is
// called repeatedly on the worker thread until Stop() is requested and must
// return periodically (block only with a timeout or on the stop token).
template <typename Derived> class Thread {
  public:
    Thread() = default;

    Thread(const Thread &) = delete;
    Thread &operator=(const Thread &) = delete;

    void Spawn() {
        if (thread_.joinable())
            return;

        thread_ =
            std::jthread([this](std::stop_token token) { threadFcn_(token); });
    }

    void Stop() {
        if (!thread_.joinable())
            return;
        thread_.request_stop();
        thread_.join();
    }

    ~Thread() = default;

  protected:
    std::stop_token get_stop_token() const { return thread_.get_stop_token(); }

  private:
    std::jthread thread_;

    Derived &derived_() { return *static_cast<Derived *>(this); }

    void threadFcn_(std::stop_token stop_token) {
        derived_().Init();

        while (!stop_token.stop_requested())
            derived_().Run();

        derived_().Shutdown();
    }
};

} // namespace oculo::core
