#pragma once

#include "config/runtime_config.hpp"
#include "managers/broadcast_manager.hpp"
#include "managers/ingest_manager.hpp"
#include "managers/message_manager.hpp"
#include <filesystem>
#include <memory>
#include <oculo/detection/tracking_session.hpp>
#include <optional>

namespace oculo_rt {

class App {
  public:
    // Usage: oculo_rt [config.json]
    explicit App(int argc, char **argv);

    // Runs until SIGINT or SIGTERM. Throws on setup failure.
    void Launch();

    ~App();

  private:
    config::RuntimeConfig loadConfig_() const;
    void buildPipeline_();

    std::optional<std::filesystem::path> config_path_;
    config::RuntimeConfig config_;

    std::shared_ptr<oculo::detection::TrackingSession> session_;
    std::shared_ptr<managers::BroadcastManager> broadcastManager_;
    std::shared_ptr<managers::MessageManager> messageManager_;
    std::shared_ptr<managers::IngestManager> ingestManager_;
};

} // namespace oculo_rt
