#pragma once
#include "oculo/core/core.hpp"
#include "oculo/core/queue.hpp"
#include "oculo/core/thread.hpp"
#include <glaze/core/context.hpp>
#include <glaze/json/read.hpp>
#include <glaze/json/schema.hpp>
#include <glaze/json/write.hpp>
#include <atomic>
#include <spdlog/spdlog.h>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>

namespace oculo::plugin {

struct ILifecycle {
    virtual void init() = 0;
    virtual void shutdown() = 0;
    virtual void reset() = 0;
    virtual ~ILifecycle() = default;
};

struct IConfigurable {
    virtual std::string getConfigSchema() = 0;
    virtual std::string getDefaultConfig() = 0;
    virtual std::error_code setConfigStr(std::string_view config_str) = 0;
    virtual ~IConfigurable() = default;
};

template <typename TConfig>
class ConfigurableBase : public virtual IConfigurable {
  public:
    std::string getConfigSchema() override {
        std::string buffer;
        if (glz::write_json_schema<TConfig>(buffer))
            return "{}";
        return buffer;
    }

    std::string getDefaultConfig() override {
        std::string buffer;
        if (glz::write_json(TConfig{}, buffer))
            return "{}";
        return buffer;
    }

    // Keeps the previous configuration when the string does not parse
    std::error_code setConfigStr(std::string_view config_str) override {
        std::string buffer(config_str);
        TConfig config{};
        if (auto ec = glz::read_json(config, buffer)) {
            spdlog::warn("Rejected configuration: {}",
                         glz::format_error(ec, buffer));
            return std::make_error_code(std::errc::invalid_argument);
        }
        config_ = std::move(config);
        onConfigChanged();
        return {};
    }

    void setConfig(const TConfig &config) {
        config_ = config;
        onConfigChanged();
    }

  protected:
    const TConfig &getConfig() const { return config_; }

    virtual void onConfigChanged() {}

  private:
    TConfig config_{};
};

template <typename T> struct ISource {
    virtual bool waitForData(T &out, std::stop_token stoken) = 0;
    virtual void cancel() = 0;
    virtual ~ISource() = default;
};

template <typename T> struct IStage {
    virtual void process(T &data) = 0;
    virtual ~IStage() = default;
};

template <typename T> struct ISink {
    virtual void consume(const T &data) = 0;
    virtual ~ISink() = default;
};

using IGazeSource = ISource<core::GazeSample>;
using IGazeStage = IStage<core::GazeSample>;
using IGazeSink = ISink<core::GazeSample>;

struct IPlugin : public virtual ILifecycle {
    virtual void setName(std::string name) = 0;
    virtual const std::string &getName() const = 0;
};

template <typename... Interfaces>
class PluginBase : public IPlugin, public virtual Interfaces... {
  public:
    void init() override { onInit(); }
    void shutdown() override { onShutdown(); }
    void reset() override { onReset(); }

    void setName(std::string name) override { name_ = std::move(name); }
    const std::string &getName() const override { return name_; }

  protected:
    virtual void onInit() {}
    virtual void onShutdown() {}
    virtual void onReset() {}

    ~PluginBase() = default;

  private:
    std::string name_;
};

// Producer thread feeding a bounded queue. Derived classes implement
// onProduce(), which must return within a bounded time (false when nothing
// was produced, e.g. on a receive timeout).
template <typename T>
class SourceBase : public virtual ISource<T>,
                   public core::Thread<SourceBase<T>> {
  public:
    explicit SourceBase(size_t max_queued = 4096)
        : output_queue_(max_queued) {}

    bool waitForData(T &out, std::stop_token stoken) override final {
        std::stop_callback cb(stoken, [this] { cancel(); });
        return output_queue_.wait_and_pop(out, cancel_source_.get_token());
    }

    void cancel() override final { cancel_source_.request_stop(); }

    void startProducing() {
        cancel_source_ = std::stop_source{};
        this->Spawn();
    }

    void stopProducing() {
        cancel();
        this->Stop();
    }

    size_t dropped() const {
        return dropped_.load(std::memory_order_relaxed);
    }

    // Thread<T> CRTP interface
    void Init() {}
    void Run() {
        T sample{};
        if (onProduce(sample) && output_queue_.push(std::move(sample))) {
            if (dropped_.fetch_add(1, std::memory_order_relaxed) == 0)
                spdlog::warn("Source: consumer is behind, dropping oldest");
        }
    }
    void Shutdown() {}

  protected:
    virtual bool onProduce(T &out) = 0;

  private:
    core::Queue<T> output_queue_;
    std::stop_source cancel_source_;
    std::atomic<size_t> dropped_{0};
};

template <typename T> class StageBase : public virtual IStage<T> {
  public:
    void process(T &data) override final { onProcess(data); }

  protected:
    virtual void onProcess(T &data) = 0;
};

template <typename T> class SinkBase : public virtual ISink<T> {
  public:
    void consume(const T &data) override { onConsume(data); }

  protected:
    virtual void onConsume(const T &data) = 0;
};

using GazeSourceBase = SourceBase<core::GazeSample>;
using GazeStageBase = StageBase<core::GazeSample>;
using GazeSinkBase = SinkBase<core::GazeSample>;

template <typename Config>
class SourcePluginBase
    : public PluginBase<GazeSourceBase, ConfigurableBase<Config>> {
  public:
    void init() override {
        PluginBase<GazeSourceBase, ConfigurableBase<Config>>::init();
        GazeSourceBase::startProducing();
    }

    void shutdown() override {
        GazeSourceBase::stopProducing();
        PluginBase<GazeSourceBase, ConfigurableBase<Config>>::shutdown();
    }
};

template <typename Config>
class StagePluginBase
    : public PluginBase<GazeStageBase, ConfigurableBase<Config>> {};

} // namespace oculo::plugin
