#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/JobLoader.hpp"
#include "core/RelayService.hpp"
#include "platform/LocalPlatform.hpp"

#include <nlohmann/json.hpp>
#include <openssl/crypto.h>

// Usage: media-relay [jobs.json]   (reads the job batch from stdin when omitted)

namespace {

std::string readBatch(int argc, char** argv) {
  if (argc > 1) {
    std::ifstream ifs(argv[1]);
    if (!ifs.is_open()) {
      throw std::runtime_error(std::string("Cannot open job batch ") + argv[1]);
    }
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
  }
  return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

}  // namespace

int main(int argc, char** argv) {
  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = relay::common::Config::load();

    relay::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = relay::common::Logger::get();
    spLog->info("Step 1: Configuration loaded (constrained host: {})", cfgApp.bConstrainedHost);

    // ── Step 2: Platform session factory ─────────────────────────────────
    if (!cfgApp.oLocalSourceDir || !cfgApp.oLocalDestDir) {
      throw std::runtime_error(
          "RELAY_LOCAL_SOURCE_DIR and RELAY_LOCAL_DEST_DIR are required for the loopback platform");
    }
    auto upFactory = std::make_unique<relay::platform::LocalSessionFactory>(
        *cfgApp.oLocalSourceDir, *cfgApp.oLocalDestDir, cfgApp.sSessionSecret);

    // Zero the credential from Config after handoff
    OPENSSL_cleanse(cfgApp.sSessionSecret.data(), cfgApp.sSessionSecret.size());
    cfgApp.sSessionSecret.clear();
    spLog->info("Step 2: Session factory ready (source={}, dest={})", *cfgApp.oLocalSourceDir,
                *cfgApp.oLocalDestDir);

    // ── Step 3: Relay service ────────────────────────────────────────────
    relay::core::RelayService rsService(cfgApp, *upFactory);
    rsService.subscribe([](const relay::common::StatusEvent& se) {
      relay::common::Logger::get()->info("event {}", nlohmann::json(se).dump());
    });
    rsService.start();
    spLog->info("Step 3: Relay service started");

    // ── Step 4: Submit the batch ─────────────────────────────────────────
    auto vJobs = relay::core::parseJobBatch(readBatch(argc, argv));
    std::vector<std::string> vJobIds;
    int iRejected = 0;
    for (auto& tj : vJobs) {
      auto durBackoff = std::chrono::milliseconds(250);
      while (true) {
        try {
          vJobIds.push_back(rsService.submit(tj));
          break;
        } catch (const relay::common::ValidationError& ex) {
          spLog->error("Job for owner {} rejected: {} ({})", tj.iOwnerId, ex.what(),
                       ex._sErrorCode);
          ++iRejected;
          break;
        } catch (const relay::common::QueueFullError& ex) {
          spLog->warn("{}; retrying in {}ms", ex.what(), durBackoff.count());
          std::this_thread::sleep_for(durBackoff);
          durBackoff = std::min(durBackoff * 2, std::chrono::milliseconds(5000));
        }
      }
    }
    spLog->info("Step 4: Submitted {} jobs", vJobIds.size());

    // ── Step 5: Wait and report ──────────────────────────────────────────
    while (!rsService.waitIdle(std::chrono::seconds(30))) {
      auto qs = rsService.queueManager().stats();
      spLog->info("Waiting: {} queued, {} running", qs.iQueued, qs.iRunning);
    }

    int iFailedJobs = iRejected;
    nlohmann::json jReport = nlohmann::json::array();
    for (const auto& sJobId : vJobIds) {
      auto oSnapshot = rsService.status(sJobId);
      if (!oSnapshot) continue;
      const auto& tj = oSnapshot->tjJob;
      if (tj.state != relay::common::JobState::Completed) ++iFailedJobs;
      nlohmann::json jJob = {{"job_id", tj.sJobId},
                             {"owner", tj.iOwnerId},
                             {"state", relay::common::toString(tj.state)},
                             {"detail", tj.sDetail}};
      if (oSnapshot->oResult) {
        jJob["result"] = *oSnapshot->oResult;
      }
      jReport.push_back(std::move(jJob));
    }
    std::cout << jReport.dump(2) << "\n";

    // ── Step 6: Ordered shutdown ─────────────────────────────────────────
    rsService.shutdown();
    spLog->info("media-relay finished: {} of {} jobs not completed", iFailedJobs,
                vJobs.size());

    return iFailedJobs == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
  } catch (const relay::common::AppError& ex) {
    std::cerr << "[fatal] " << ex._sErrorCode << ": " << ex.what() << "\n";
    return EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] startup failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
