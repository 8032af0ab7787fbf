#include <exception>
#include <filesystem>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "sh/content/ContentNode.hpp"
#include "sh/core/Logger.hpp"
#include "sh/core/Stage.hpp"
#include "sh/core/TransitionEvents.hpp"
#include "sh/utils/Config.hpp"

namespace {

// Setup work that finishes after a number of frames, like a loading screen.
struct Warmup {
    sh::core::TaskSource<void> done;
    int framesLeft = 0;
};

void RegisterBehaviours(sh::core::Stage& stage, std::shared_ptr<Warmup>& warmup) {
    auto& behaviours = stage.Behaviours();

    behaviours.Register("MainMenu", [&stage](sh::content::ContentNode& node) {
        node.SetStartHook([&node]() {
            sh::core::Logger::Info("[Demo] {} ready: {}", node.GetName(),
                                   node.Properties().value("title", std::string("untitled")));
            return sh::core::Task<void>::Resolved();
        });
        node.SetTeardownHook([&node]() {
            sh::core::Logger::Info("[Demo] {} tearing down after {:.2f}s", node.GetName(),
                                   node.GetSimulatedTime());
            return sh::core::Task<void>::Resolved();
        });
        node.SetUpdateCallback([&stage](sh::content::ContentNode& self, float) {
            const double idle = self.Properties().value("idleSeconds", 1.0);
            if (self.GetSimulatedTime() < idle || stage.Controller().IsBusy()) {
                return;
            }
            const std::string next = self.Properties().value("next", std::string("level1"));
            nlohmann::json options = {{"difficulty", "normal"}};
            auto request = stage.Transition(sh::content::Identifier{next}, sh::content::ParamList{options});
            if (request.IsFailed()) {
                sh::core::Logger::Warning("[Demo] Could not leave {} for '{}'", self.GetName(), next);
            }
        });
    });

    behaviours.Register("Level", [&stage, &warmup](sh::content::ContentNode& node) {
        node.SetSetupHook([&node, &warmup](const sh::content::ParamList& params) {
            if (!params.empty()) {
                node.Properties()["options"] = params.front();
            }
            warmup = std::make_shared<Warmup>();
            warmup->framesLeft = node.Properties().value("warmupFrames", 0);
            sh::core::Logger::Info("[Demo] {} warming up for {} frame(s)", node.GetName(), warmup->framesLeft);
            return warmup->done.GetTask();
        });
        node.SetStartHook([&node]() {
            sh::core::Logger::Info("[Demo] {} started with options {}", node.GetName(),
                                   node.Properties().value("options", nlohmann::json::object()).dump());
            return sh::core::Task<void>::Resolved();
        });
        node.SetUpdateCallback([&stage](sh::content::ContentNode& self, float) {
            if (self.GetSimulatedTime() >= self.Properties().value("playSeconds", 1.0)) {
                stage.RequestExit();
            }
        });
    });
}

} // namespace

int main(int argc, char** argv) {
    try {
        sh::core::Logger::ConfigureFromEnvironment();

        const std::filesystem::path configPath =
            argc > 1 ? std::filesystem::path(argv[1]) : std::filesystem::path(SH_CONFIG_PATH);
        auto configResult = sh::utils::ConfigLoader::Load(configPath);

        if (configResult.HasErrors()) {
            sh::core::Logger::Error("[main] Configuration errors detected. Please fix the following:");
            for (const auto& error : configResult.errors) {
                sh::core::Logger::Error("[main]   - {}", error);
            }
            return 1;
        }

        sh::core::Stage stage(configResult.config);
        std::shared_ptr<Warmup> warmup;
        RegisterBehaviours(stage, warmup);

        sh::core::EventBus::ScopedSubscription onFailed(
            stage.Events().Subscribe(sh::TransitionEvents::TransitionFailed, [&stage]() {
                sh::core::Logger::Error("[main] Transition failed, stopping");
                stage.RequestExit();
            }));

        auto first = stage.Bootstrap();
        if (first.IsFailed()) {
            first.Get();
        }

        stage.Run([&warmup](sh::core::StageContext&, float) {
            if (warmup && warmup->framesLeft-- <= 0) {
                warmup->done.Complete();
                warmup.reset();
            }
        });

        return stage.Slot().IsOccupied() && !stage.Pause().IsPaused() ? 0 : 1;
    } catch (const std::exception& ex) {
        sh::core::Logger::Error("[main] Fatal exception: {}", ex.what());
        return 1;
    }
}
