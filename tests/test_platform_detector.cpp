/**
 * test_platform_detector.cpp - Unit tests for platform detection, status parsing and lifecycle
 */

#include "dp/Config.hpp"
#include "dp/LifecycleController.hpp"
#include "dp/Log.hpp"
#include "dp/Platform.hpp"
#include "Fakes.hpp"

#include <cassert>
#include <iostream>

namespace {

const std::string DDEV_DESCRIBE =
    "{\"level\":\"info\",\"msg\":\"my-blog is running\",\"raw\":{"
    "\"name\":\"my-blog\",\"status\":\"running\","
    "\"primary_url\":\"https://my-blog.ddev.site\","
    "\"services\":{\"web\":{\"status\":\"running\"},\"db\":{\"status\":\"stopped\"}}}}";

const std::string LANDO_INFO =
    "[{\"service\":\"appserver\",\"urls\":[\"http://shop.lndo.site/\",\"https://shop.lndo.site/\"],\"healthy\":true},"
    " {\"service\":\"database\",\"urls\":[],\"healthy\":false}]";

} // anonymous namespace

void test_detect_platforms() {
    dp_test::TempDir sites;
    sites.write("blog/.ddev/config.yaml", "name: blog\n");
    sites.write("shop/.lando.yml", "name: shop\n");
    sites.mkdir("bare");

    assert(dp::PlatformDetector::detect(sites.path() + "/blog") == dp::Platform::DDEV);
    assert(dp::PlatformDetector::detect(sites.path() + "/shop") == dp::Platform::LANDO);
    assert(dp::PlatformDetector::detect(sites.path() + "/bare") == dp::Platform::UNKNOWN);

    std::cout << "[PASS] test_detect_platforms\n";
}

void test_ddev_wins_when_both_present() {
    dp_test::TempDir sites;
    sites.write("both/.ddev/config.yaml");
    sites.write("both/.lando.yml");

    assert(dp::PlatformDetector::detect(sites.path() + "/both") == dp::Platform::DDEV);

    std::cout << "[PASS] test_ddev_wins_when_both_present\n";
}

void test_detection_is_idempotent() {
    dp_test::TempDir sites;
    sites.write("blog/.ddev/config.yaml");

    auto first = dp::PlatformDetector::describe("blog", sites.path());
    auto second = dp::PlatformDetector::describe("blog", sites.path());

    assert(first.exists && second.exists);
    assert(first.platform == second.platform);
    assert(first.directory == second.directory);

    auto missing = dp::PlatformDetector::describe("nope", sites.path());
    assert(!missing.exists);
    assert(missing.platform == dp::Platform::UNKNOWN);

    std::cout << "[PASS] test_detection_is_idempotent\n";
}

void test_ddev_status_parsing() {
    dp::DdevBackend ddev;

    auto summary = ddev.parseStatus(DDEV_DESCRIBE, "my-blog");
    assert(summary.state == dp::SiteState::RUNNING);
    assert(summary.url == "https://my-blog.ddev.site");
    assert(summary.services["web"] == "running");
    assert(summary.services["db"] == "stopped");

    // One JSON record per line, preceded by noise
    auto lines = ddev.parseStatus("Starting...\n" + DDEV_DESCRIBE + "\n", "my-blog");
    assert(lines.state == dp::SiteState::RUNNING);

    auto text = ddev.parseStatus("Project my-blog is stopped.", "my-blog");
    assert(text.state == dp::SiteState::STOPPED);
    assert(text.url == "https://my-blog.ddev.site");

    std::cout << "[PASS] test_ddev_status_parsing\n";
}

void test_lando_status_parsing() {
    dp::LandoBackend lando;

    auto summary = lando.parseStatus(LANDO_INFO, "shop");
    assert(summary.state == dp::SiteState::RUNNING);
    assert(summary.url == "https://shop.lndo.site/");
    assert(summary.services["appserver"] == "running");
    assert(summary.services["database"] == "stopped");

    auto down = lando.parseStatus("[{\"service\":\"appserver\",\"urls\":[]}]", "shop");
    assert(down.state == dp::SiteState::STOPPED);

    assert(dp::guessStateFromText("garbage") == dp::SiteState::ERROR);

    std::cout << "[PASS] test_lando_status_parsing\n";
}

void test_lifecycle_commands_and_timeouts() {
    dp::DdevBackend ddev("/opt/ddev");
    assert(ddev.command(dp::LifecycleAction::STATUS).size() == 3);
    assert(ddev.command(dp::LifecycleAction::START)[0] == "/opt/ddev");

    dp::LandoBackend lando;
    assert(lando.command(dp::LifecycleAction::STATUS)[1] == "info");

    assert(dp::PlatformBackend::timeoutSeconds(dp::LifecycleAction::START) == 300);
    assert(dp::PlatformBackend::timeoutSeconds(dp::LifecycleAction::STOP) == 120);
    assert(dp::PlatformBackend::timeoutSeconds(dp::LifecycleAction::STATUS) == 60);

    std::cout << "[PASS] test_lifecycle_commands_and_timeouts\n";
}

void test_controller_start_stop() {
    dp_test::TempDir sites;
    sites.write("shop/.lando.yml");

    dp::Config config;
    config.site_directory = sites.path();
    dp_test::FakeRunner runner;
    dp::LifecycleController controller(runner, config);

    auto started = controller.run(dp::LifecycleAction::START, "shop");
    assert(started.success);
    assert(started.data["platform"] == "lando");
    assert(started.data["status"] == "running");
    assert(runner.calls.back() == std::vector<std::string>({"lando", "start"}));
    assert(runner.cwds.back() == sites.path() + "/shop");

    auto stopped = controller.run(dp::LifecycleAction::STOP, "shop");
    assert(stopped.data["status"] == "stopped");

    std::cout << "[PASS] test_controller_start_stop\n";
}

void test_controller_failures() {
    dp_test::TempDir sites;
    sites.write("blog/.ddev/config.yaml");
    sites.mkdir("bare");

    dp::Config config;
    config.site_directory = sites.path();
    dp_test::FakeRunner runner;
    dp::LifecycleController controller(runner, config);

    auto expectError = [&](dp::LifecycleAction action, const std::string& site, dp::ErrorKind kind) {
        try {
            controller.run(action, site);
        } catch (const dp::Error& e) {
            assert(e.kind() == kind);
            return e.toResult();
        }
        assert(false && "expected dp::Error");
        return dp::Result();
    };

    expectError(dp::LifecycleAction::START, "missing", dp::ErrorKind::NOT_FOUND);
    expectError(dp::LifecycleAction::START, "bare", dp::ErrorKind::PLATFORM);

    runner.next.exit_code = 1;
    runner.next.err = "docker is not running";
    auto failed = expectError(dp::LifecycleAction::START, "blog", dp::ErrorKind::PLATFORM);
    assert(failed.data["status"] == "error");
    assert(failed.data["exit_code"] == 1);
    assert(failed.data["output"] == "docker is not running");

    runner.next.exit_code = -1;
    runner.next.timed_out = true;
    auto timed_out = expectError(dp::LifecycleAction::RESTART, "blog", dp::ErrorKind::PLATFORM);
    assert(timed_out.message.find("timed out") != std::string::npos);

    runner.installed.erase("ddev");
    auto missing_tool = expectError(dp::LifecycleAction::STATUS, "blog", dp::ErrorKind::PLATFORM);
    assert(missing_tool.data.contains("install"));

    std::cout << "[PASS] test_controller_failures\n";
}

void test_state_follows_tool_output() {
    dp_test::TempDir sites;
    sites.write("shop/.lando.yml");

    dp::Config config;
    config.site_directory = sites.path();
    dp_test::FakeRunner runner;
    dp::LifecycleController controller(runner, config);

    dp::ProcessResult stopped_anyway;
    stopped_anyway.exit_code = 0;
    stopped_anyway.out = "Starting shop...\nApp shop is stopped\n";
    runner.script.push_back(stopped_anyway);
    auto started = controller.run(dp::LifecycleAction::START, "shop");
    assert(started.success);
    assert(started.data["status"] == "stopped");

    // Progress chatter mentioning "stopped" before the final line
    dp::ProcessResult restarted;
    restarted.exit_code = 0;
    restarted.err = "Stopped containers\nSuccessfully restarted shop\n";
    runner.script.push_back(restarted);
    assert(controller.run(dp::LifecycleAction::RESTART, "shop").data["status"] == "running");

    dp::ProcessResult quiet;
    quiet.exit_code = 0;
    runner.script.push_back(quiet);
    assert(controller.run(dp::LifecycleAction::START, "shop").data["status"] == "running");
    runner.script.push_back(quiet);
    assert(controller.run(dp::LifecycleAction::STOP, "shop").data["status"] == "stopped");

    dp::ProcessResult still_up;
    still_up.out = "shop is still running\n";
    assert(dp::LifecycleController::stateAfter(dp::LifecycleAction::STOP, still_up) ==
           dp::SiteState::RUNNING);

    std::cout << "[PASS] test_state_follows_tool_output\n";
}

void test_cleaned_name_lookup() {
    dp_test::TempDir sites;
    sites.write("my-blog/.ddev/config.yaml");

    dp::Config config;
    config.site_directory = sites.path();
    dp_test::FakeRunner runner;
    dp::LifecycleController controller(runner, config);

    auto started = controller.run(dp::LifecycleAction::START, "My_Blog");
    assert(started.success);
    assert(started.data["project_name"] == "my-blog");
    assert(runner.cwds.back() == sites.path() + "/my-blog");

    try {
        controller.run(dp::LifecycleAction::START, "Other_Site");
        assert(false && "expected dp::Error");
    } catch (const dp::Error& e) {
        assert(e.kind() == dp::ErrorKind::NOT_FOUND);
        assert(e.data()["cleaned_name"] == "other-site");
        assert(e.suggestions()[0].find("create site named other-site") != std::string::npos);
    }

    std::cout << "[PASS] test_cleaned_name_lookup\n";
}

int main() {
    std::cout << "Running PlatformDetector tests...\n\n";
    dp::log::setLevel(dp::log::Level::ERROR);

    test_detect_platforms();
    test_ddev_wins_when_both_present();
    test_detection_is_idempotent();
    test_ddev_status_parsing();
    test_lando_status_parsing();
    test_lifecycle_commands_and_timeouts();
    test_controller_start_stop();
    test_controller_failures();
    test_state_follows_tool_output();
    test_cleaned_name_lookup();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
