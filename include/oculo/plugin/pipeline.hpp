#pragma once
#include "oculo/plugin/interfaces.hpp"
#include <vector>

namespace oculo::plugin {

// Source -> Stage* -> Sink*. The pipeline does not own its plugins; it only
// sequences their lifecycle and pushes each item through in order.
template <typename T> class Pipeline {
  public:
    void setSource(IPlugin *plugin, ISource<T> *source) {
        source_ = {plugin, source};
    }

    void addStage(IPlugin *plugin, IStage<T> *stage) {
        stages_.push_back({plugin, stage});
    }

    void addSink(IPlugin *plugin, ISink<T> *sink) {
        sinks_.push_back({plugin, sink});
    }

    // Sinks first, source last: nothing is produced before it can be consumed
    void init() {
        for (auto &[plugin, _] : sinks_)
            if (plugin)
                plugin->init();
        for (auto &[plugin, _] : stages_)
            if (plugin)
                plugin->init();
        if (source_.plugin)
            source_.plugin->init();
        initialized_ = true;
    }

    void shutdown() {
        if (source_.plugin)
            source_.plugin->shutdown();
        for (auto &[plugin, _] : stages_)
            if (plugin)
                plugin->shutdown();
        for (auto &[plugin, _] : sinks_)
            if (plugin)
                plugin->shutdown();
        initialized_ = false;
    }

    void processData(T data) {
        for (auto &[_, stage] : stages_)
            stage->process(data);

        for (auto &[_, sink] : sinks_)
            sink->consume(data);
    }

    // Drops per-session state held by stages and sinks
    void reset() {
        for (auto &[plugin, _] : stages_)
            if (plugin)
                plugin->reset();
        for (auto &[plugin, _] : sinks_)
            if (plugin)
                plugin->reset();
    }

    ISource<T> *getSourceInterface() const { return source_.iface; }

    size_t stageCount() const { return stages_.size(); }
    size_t sinkCount() const { return sinks_.size(); }
    bool isInitialized() const { return initialized_; }

  private:
    template <typename I> struct PluginInterface {
        IPlugin *plugin = nullptr;
        I *iface = nullptr;
    };

    PluginInterface<ISource<T>> source_;
    std::vector<PluginInterface<IStage<T>>> stages_;
    std::vector<PluginInterface<ISink<T>>> sinks_;
    bool initialized_ = false;
};

using GazePipeline = Pipeline<core::GazeSample>;

} // namespace oculo::plugin
