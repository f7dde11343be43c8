#include "session/session_driver.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <iostream>
#include <string>

namespace {

namespace protocol = replica::protocol;
namespace session = replica::session;

bool Expect(bool condition, const char* message) {
    if (!condition) {
        std::cerr << "[FAIL] " << message << '\n';
        return false;
    }
    return true;
}

class RecordingHost final : public session::ISessionHost {
public:
    session::Viewpoint CurrentViewpoint() const override {
        ++viewpoint_reads;
        return viewpoint;
    }

    void PresentFrame(const replica::cache::ObjectCache& cache, const session::Viewpoint& presented) override {
        (void)presented;
        ++frame_count;
        last_cache_size = cache.Size();
    }

    session::Viewpoint viewpoint{};
    mutable int viewpoint_reads = 0;
    int frame_count = 0;
    std::size_t last_cache_size = 0;
};

nlohmann::json RequestOf(const session::SessionStep& step) {
    if (!step.IsSend()) {
        return nlohmann::json::object();
    }
    return nlohmann::json::parse(step.request, nullptr, false);
}

std::string CommandOf(const session::SessionStep& step) {
    const nlohmann::json request = RequestOf(step);
    return request.is_object() ? request.value("cmd", "") : "";
}

constexpr const char* kOk = R"({"ok": true, "payload": {}})";
constexpr const char* kRejected = R"({"ok": false})";
constexpr const char* kSelfId = R"({"ok": true, "payload": {"objID": [1, 0, 0]}})";
constexpr const char* kPlayerId = R"({"ok": true, "payload": {"objID": [2, 0, 0]}})";
constexpr const char* kTwoObjects = R"({"ok": true, "payload": {"objIDs": [[2, 0, 0], [3, 0, 0]]}})";
constexpr const char* kTwoStates =
    R"({"ok": true, "payload": {"data": [{"sv": {}}, {"sv": {"position": [1, 2, 3], "scale": 2}}]}})";
constexpr const char* kTemplateId = R"({"ok": true, "payload": {"templateID": [9, 0, 0]}})";
constexpr const char* kTemplate =
    R"({"ok": true, "payload": {"geo": [0,0,0, 1,0,0, 0,1,0], "cs": [4, 1, 1, 1]}})";

// Runs ping, identity, template registration and self spawn.
session::SessionStep RunHandshake(session::SessionDriver& driver) {
    session::SessionStep step = driver.Start();
    step = driver.Resume(kOk);
    step = driver.Resume(kSelfId);
    step = driver.Resume(kOk);
    return driver.Resume(kPlayerId);
}

}  // namespace

int main() {
    bool passed = true;

    {
        RecordingHost host;
        session::SpawnMailbox mailbox;
        session::SessionDriver driver(host, mailbox);

        passed &= Expect(driver.Stage() == session::SessionStage::Idle, "Driver should start idle.");
        passed &= Expect(!driver.HasRequestInFlight(), "Idle driver should have nothing in flight.");

        session::SessionStep step = driver.Start();
        passed &= Expect(CommandOf(step) == "ping_clacks", "Start should send ping.");
        passed &= Expect(driver.HasRequestInFlight(), "Ping should be in flight.");
        passed &= Expect(driver.PendingCommandName() == "ping_clacks", "Pending command should be ping.");
        passed &= Expect(driver.Stage() == session::SessionStage::Handshake, "Start should enter handshake.");

        step = driver.Resume(kOk);
        passed &= Expect(CommandOf(step) == "set_id", "Ping reply should lead to set_id.");
        passed &= Expect(RequestOf(step)["payload"]["objID"].is_null(), "Identity should be left to the server.");

        step = driver.Resume(kSelfId);
        passed &= Expect(CommandOf(step) == "add_template", "Identity reply should lead to add_template.");
        passed &= Expect(
            driver.SelfId().has_value() && *driver.SelfId() == protocol::ObjectId{1, 0, 0},
            "Self id should be recorded.");
        passed &= Expect(
            RequestOf(step)["payload"]["name"] == nlohmann::json::array({111, 108, 105}),
            "Controller template id should be sent.");
        passed &= Expect(RequestOf(step)["payload"]["geo"].size() == 108, "Controller cube should be sent.");

        step = driver.Resume(kOk);
        passed &= Expect(CommandOf(step) == "spawn", "Template ack should lead to self spawn.");
        const nlohmann::json self_spawn = RequestOf(step)["payload"];
        passed &= Expect(
            self_spawn["sv"]["velocityLin"] == nlohmann::json::array({0.0, 0.0, 50.0}),
            "Self spawn should launch along +Z.");
        passed &= Expect(self_spawn["templateID"] == nlohmann::json::array({111, 108, 105}), "Self spawn template.");

        step = driver.Resume(kPlayerId);
        passed &= Expect(CommandOf(step) == "get_all_objids", "Self spawn should enter the steady loop.");
        passed &= Expect(driver.Stage() == session::SessionStage::SteadyState, "Driver should be in steady state.");
        passed &= Expect(
            driver.PlayerId().has_value() && *driver.PlayerId() == protocol::ObjectId{2, 0, 0},
            "Player id should be recorded.");

        step = driver.Resume(kTwoObjects);
        passed &= Expect(CommandOf(step) == "get_statevar", "Object list should lead to state query.");
        passed &= Expect(RequestOf(step)["payload"]["objIDs"].size() == 2, "State query should cover every id.");

        step = driver.Resume(kTwoStates);
        passed &= Expect(CommandOf(step) == "get_template_id", "New object should need a template lookup.");
        passed &= Expect(
            RequestOf(step)["payload"]["objID"] == nlohmann::json::array({3, 0, 0}),
            "Lookup should skip the controller and target [3,0,0].");

        step = driver.Resume(kTemplateId);
        passed &= Expect(CommandOf(step) == "get_template", "Template id should lead to template fetch.");

        step = driver.Resume(kTemplate);
        passed &= Expect(CommandOf(step) == "suggest_pos", "Reconcile should end with suggest_pos.");
        passed &= Expect(host.frame_count == 1, "One frame should be presented per cycle.");
        passed &= Expect(
            RequestOf(step)["payload"]["objID"] == nlohmann::json::array({2, 0, 0}),
            "Position suggestion should target the controller.");

        const replica::cache::ObjectCache& object_cache = driver.Cache();
        passed &= Expect(object_cache.Size() == 1, "Cache should hold only the foreign object.");
        passed &= Expect(!object_cache.Contains(protocol::ObjectId{2, 0, 0}), "Controller should not be cached.");
        const replica::cache::CacheEntry* entry = object_cache.Find(protocol::ObjectId{3, 0, 0});
        passed &= Expect(entry != nullptr, "Foreign object should be cached.");
        if (entry != nullptr) {
            passed &= Expect(entry->state.position == protocol::Vec3(1.0, 2.0, 3.0), "Cached position should match.");
            passed &= Expect(
                entry->template_id.has_value() && *entry->template_id == protocol::TemplateId{9, 0, 0},
                "Cached template id should match.");
            passed &= Expect(
                entry->mesh.has_value() && entry->mesh->triangles.size() == 1,
                "Cached entry should carry the compiled mesh.");
            if (entry->mesh.has_value() && !entry->mesh->triangles.empty()) {
                passed &= Expect(
                    std::abs(entry->mesh->triangles[0].vertices[1].x - 2.0F) < 1e-6F,
                    "Mesh should be scaled by the object's scale.");
            }
        }
        passed &= Expect(
            driver.Templates().LookupCount() + driver.Templates().FetchCount() == 2,
            "First sighting should cost one lookup and one fetch.");

        step = driver.Resume(kOk);
        passed &= Expect(CommandOf(step) == "get_all_objids", "Suggest ack should start the next cycle.");
        passed &= Expect(driver.CompletedCycleCount() == 1, "One cycle should be complete.");

        step = driver.Resume(kTwoObjects);
        step = driver.Resume(
            R"({"ok": true, "payload": {"data": [{"sv": {}}, {"sv": {"position": [4, 5, 6], "scale": 2}}]}})");
        passed &= Expect(CommandOf(step) == "suggest_pos", "Known object should not trigger lookups.");
        passed &= Expect(
            driver.Templates().LookupCount() + driver.Templates().FetchCount() == 2,
            "Second sighting should cost no resolver calls.");
        passed &= Expect(
            driver.Cache().Find(protocol::ObjectId{3, 0, 0})->state.position == protocol::Vec3(4.0, 5.0, 6.0),
            "Second cycle should refresh the cached state.");

        host.viewpoint.position = protocol::Vec3(0.0, 0.0, 0.0);
        mailbox.Request();
        step = driver.Resume(kOk);
        step = driver.Resume(kTwoObjects);
        step = driver.Resume(kTwoStates);
        passed &= Expect(CommandOf(step) == "spawn", "Pending spawn request should be sent after reconcile.");
        const nlohmann::json projectile = RequestOf(step)["payload"]["sv"];
        passed &= Expect(
            projectile["position"] == nlohmann::json::array({0.0, 0.0, -2.0}),
            "Projectile should spawn two units along the view direction.");
        passed &= Expect(
            projectile["velocityLin"] == nlohmann::json::array({0.0, 0.0, -0.2}),
            "Projectile should move along the view direction.");
        passed &= Expect(projectile["scale"] == 0.25 && projectile["imass"] == 20.0, "Projectile mass and scale.");
        passed &= Expect(projectile["cshape"] == nlohmann::json::array({4, 1, 1, 1}), "Projectile collision shape.");
        passed &= Expect(!mailbox.IsPending(), "Spawn request should be consumed.");
        passed &= Expect(driver.SpawnRequestCount() == 1, "Spawn should be counted.");

        step = driver.Resume(kRejected);
        passed &= Expect(CommandOf(step) == "suggest_pos", "Rejected spawn should not end the cycle.");
        passed &= Expect(driver.RejectedSpawnCount() == 1, "Rejected spawn should be counted.");
        passed &= Expect(!driver.IsFinished(), "Rejected spawn should not finish the session.");

        step = driver.Resume(kOk);
        step = driver.Resume(kRejected);
        passed &= Expect(!step.IsSend(), "Rejected object list should finish the session.");
        passed &= Expect(driver.IsFinished(), "Driver should be finished.");
        passed &= Expect(!driver.HasRequestInFlight(), "Finished driver should have nothing in flight.");
        passed &= Expect(
            driver.FinishReason().find("enumeration") != std::string::npos,
            "Finish reason should name the failed step.");

        const std::uint64_t request_count = driver.RequestCount();
        step = driver.Resume(kOk);
        passed &= Expect(!step.IsSend(), "Finished driver should not send.");
        passed &= Expect(driver.RequestCount() == request_count, "Finished driver should not issue requests.");
    }

    {
        RecordingHost host;
        session::SpawnMailbox mailbox;
        session::SessionDriver driver(host, mailbox);
        const session::SessionStep step = driver.Resume(kOk);
        passed &= Expect(!step.IsSend(), "Reply without a request should finish the session.");
        passed &= Expect(driver.IsFinished(), "Unsolicited reply should be fatal.");
    }

    {
        RecordingHost host;
        session::SpawnMailbox mailbox;
        session::SessionDriver driver(host, mailbox);
        (void)driver.Start();
        const session::SessionStep step = driver.Resume(kRejected);
        passed &= Expect(!step.IsSend() && driver.IsFinished(), "Rejected ping should be fatal.");
    }

    {
        RecordingHost host;
        session::SpawnMailbox mailbox;
        session::SessionDriver driver(host, mailbox);
        session::SessionStep step = driver.Start();
        step = driver.Resume(kOk);
        step = driver.Resume(kSelfId);
        step = driver.Resume(kRejected);
        passed &= Expect(CommandOf(step) == "spawn", "Rejected template registration should be tolerated.");
        step = driver.Resume(kRejected);
        passed &= Expect(!step.IsSend() && driver.IsFinished(), "Rejected self spawn should be fatal.");
    }

    {
        RecordingHost host;
        session::SpawnMailbox mailbox;
        session::SessionDriver driver(host, mailbox);
        (void)driver.Start();
        const session::SessionStep step = driver.Resume("{\"ok\": tru");
        passed &= Expect(!step.IsSend(), "Malformed reply should finish the session.");
        passed &= Expect(
            driver.FinishReason().find("malformed reply to ping_clacks") != std::string::npos,
            "Malformed reply reason should name the command.");
    }

    {
        RecordingHost host;
        session::SpawnMailbox mailbox;
        session::SessionDriver driver(host, mailbox);
        session::SessionStep step = RunHandshake(driver);
        step = driver.Resume(kTwoObjects);
        step = driver.Resume(R"({"ok": true, "payload": {"data": [{"sv": {}}]}})");
        passed &= Expect(!step.IsSend(), "State count mismatch should finish the session.");
    }

    {
        RecordingHost host;
        session::SpawnMailbox mailbox;
        session::SessionDriver driver(host, mailbox);
        session::SessionStep step = RunHandshake(driver);
        step = driver.Resume(kTwoObjects);
        step = driver.Resume(kTwoStates);
        mailbox.Request();
        step = driver.Resume(kRejected);
        passed &= Expect(CommandOf(step) == "get_all_objids", "Rejected lookup should restart the cycle.");
        passed &= Expect(!driver.IsFinished(), "Rejected lookup should not finish the session.");
        passed &= Expect(driver.AbortedReconcileCount() == 1, "Aborted cycle should be counted.");
        passed &= Expect(host.frame_count == 0, "Aborted cycle should not present a frame.");
        passed &= Expect(driver.CompletedCycleCount() == 0, "Aborted cycle should not count as completed.");
        passed &= Expect(mailbox.IsPending(), "Aborted cycle should leave the spawn request pending.");
        const replica::cache::CacheEntry* entry = driver.Cache().Find(protocol::ObjectId{3, 0, 0});
        passed &= Expect(
            entry != nullptr && !entry->template_id.has_value() && !entry->mesh.has_value(),
            "Unresolved entry should stay cached without a template.");
        (void)mailbox.TryConsume();

        step = driver.Resume(kTwoObjects);
        step = driver.Resume(kTwoStates);
        passed &= Expect(CommandOf(step) == "get_template_id", "Unresolved entry should be retried next cycle.");
        step = driver.Resume(kTemplateId);
        step = driver.Resume(R"({"ok": true, "payload": {"geo": [0, 0, 0, 1], "cs": [4, 1, 1, 1]}})");
        passed &= Expect(CommandOf(step) == "suggest_pos", "Uncompilable geometry should not stop the cycle.");
        entry = driver.Cache().Find(protocol::ObjectId{3, 0, 0});
        passed &= Expect(
            entry != nullptr && entry->template_id.has_value() && !entry->mesh.has_value(),
            "Uncompilable geometry should leave the entry without a mesh.");
    }

    {
        RecordingHost host;
        session::SpawnMailbox mailbox;
        session::SessionDriver driver(host, mailbox);
        session::SessionStep step = driver.Start();
        step = driver.Resume(kOk);
        step = driver.Resume(kRejected);
        passed &= Expect(!step.IsSend() && driver.IsFinished(), "Rejected identity should be fatal.");
        passed &= Expect(
            driver.FinishReason().find("identity") != std::string::npos,
            "Identity finish reason should name the step.");
        passed &= Expect(!driver.SelfId().has_value(), "Rejected identity should leave no self id.");
    }

    {
        RecordingHost host;
        session::SpawnMailbox mailbox;
        session::SessionDriver driver(host, mailbox);
        session::SessionStep step = RunHandshake(driver);
        step = driver.Resume(kTwoObjects);
        step = driver.Resume(kRejected);
        passed &= Expect(!step.IsSend() && driver.IsFinished(), "Rejected state query should be fatal.");
        passed &= Expect(
            driver.FinishReason().find("state variable query") != std::string::npos,
            "State query finish reason should name the step.");
        passed &= Expect(driver.Cache().Empty(), "Rejected state query should cache nothing.");
    }

    {
        RecordingHost host;
        session::SpawnMailbox mailbox;
        session::SessionDriver driver(host, mailbox);
        session::SessionStep step = RunHandshake(driver);
        step = driver.Resume(R"({"ok": true, "payload": {"objIDs": [[2, 0, 0], [3, 0, 0], [4, 0, 0]]}})");
        step = driver.Resume(
            R"({"ok": true, "payload": {"data": [{"sv": {}}, {"sv": null}, {"sv": {"position": [7, 8, 9]}}]}})");
        passed &= Expect(!driver.IsFinished(), "Object vanishing mid-cycle should not finish the session.");
        passed &= Expect(CommandOf(step) == "get_template_id", "Live object should still be resolved.");
        passed &= Expect(
            RequestOf(step)["payload"]["objID"] == nlohmann::json::array({4, 0, 0}),
            "Lookup should skip the vanished object.");
        step = driver.Resume(kTemplateId);
        step = driver.Resume(kTemplate);
        passed &= Expect(CommandOf(step) == "suggest_pos", "Cycle with a vanished object should complete.");
        passed &= Expect(!driver.Cache().Contains(protocol::ObjectId{3, 0, 0}), "Vanished object should not be cached.");
        const replica::cache::CacheEntry* entry = driver.Cache().Find(protocol::ObjectId{4, 0, 0});
        passed &= Expect(
            entry != nullptr && entry->state.position == protocol::Vec3(7.0, 8.0, 9.0),
            "Live object should be cached with its state.");
        passed &= Expect(driver.Templates().LookupCount() == 1, "Vanished object should cost no lookup.");
    }

    {
        RecordingHost host;
        session::SpawnMailbox mailbox;
        session::SessionDriver driver(host, mailbox);
        session::SessionStep step = RunHandshake(driver);
        step = driver.Resume(kTwoObjects);
        step = driver.Resume(kTwoStates);
        step = driver.Resume(kTemplateId);
        passed &= Expect(CommandOf(step) == "get_template", "Template id should lead to a fetch.");
        step = driver.Resume(kRejected);
        passed &= Expect(CommandOf(step) == "get_all_objids", "Rejected fetch should restart the cycle.");
        passed &= Expect(!driver.IsFinished(), "Rejected fetch should not finish the session.");
        passed &= Expect(driver.AbortedReconcileCount() == 1, "Rejected fetch should be counted.");
        passed &= Expect(host.frame_count == 0, "Rejected fetch should not present a frame.");
        const replica::cache::CacheEntry* entry = driver.Cache().Find(protocol::ObjectId{3, 0, 0});
        passed &= Expect(
            entry != nullptr && entry->template_id.has_value() && !entry->mesh.has_value(),
            "Entry should keep its template id without a mesh.");
        passed &= Expect(
            !driver.Templates().IsMemoized(protocol::TemplateId{9, 0, 0}),
            "Rejected template should not be memoized.");

        step = driver.Resume(kTwoObjects);
        step = driver.Resume(kTwoStates);
        passed &= Expect(CommandOf(step) == "get_template", "Known template id should be fetched directly.");
        passed &= Expect(
            RequestOf(step)["payload"]["templateID"] == nlohmann::json::array({9, 0, 0}),
            "Direct fetch should target the stored template id.");
        passed &= Expect(driver.Templates().LookupCount() == 1, "Direct fetch should skip the id lookup.");
        step = driver.Resume(kTemplate);
        passed &= Expect(CommandOf(step) == "suggest_pos", "Direct fetch should complete the cycle.");
        entry = driver.Cache().Find(protocol::ObjectId{3, 0, 0});
        passed &= Expect(entry != nullptr && entry->mesh.has_value(), "Direct fetch should attach the mesh.");
        passed &= Expect(driver.Templates().FetchCount() == 2, "Both fetch attempts should be counted.");
    }

    {
        RecordingHost host;
        session::SpawnMailbox mailbox;
        session::SessionOptions options{};
        options.evict_after_cycles = 1;
        session::SessionDriver driver(host, mailbox, options);
        session::SessionStep step = RunHandshake(driver);
        step = driver.Resume(kTwoObjects);
        step = driver.Resume(kTwoStates);
        step = driver.Resume(kTemplateId);
        step = driver.Resume(kTemplate);
        passed &= Expect(driver.Cache().Size() == 1, "Object should be cached before eviction.");
        step = driver.Resume(kOk);
        step = driver.Resume(R"({"ok": true, "payload": {"objIDs": [[2, 0, 0]]}})");
        step = driver.Resume(R"({"ok": true, "payload": {"data": [{"sv": {}}]}})");
        passed &= Expect(CommandOf(step) == "suggest_pos", "Cycle without foreign objects should complete.");
        passed &= Expect(driver.Cache().Empty(), "Vanished object should be evicted.");
        passed &= Expect(host.last_cache_size == 0, "Presented cache should reflect the eviction.");
    }

    {
        RecordingHost host;
        session::SpawnMailbox mailbox;
        session::SessionOptions options{};
        options.evict_after_cycles = 1;
        session::SessionDriver driver(host, mailbox, options);
        session::SessionStep step = RunHandshake(driver);
        step = driver.Resume(kTwoObjects);
        step = driver.Resume(kTwoStates);
        step = driver.Resume(kTemplateId);
        step = driver.Resume(kTemplate);
        step = driver.Resume(kOk);
        step = driver.Resume(kTwoObjects);
        step = driver.Resume(R"({"ok": true, "payload": {"data": [{"sv": {}}, {"sv": null}]}})");
        passed &= Expect(CommandOf(step) == "suggest_pos", "Cycle with a null state should complete.");
        passed &= Expect(driver.Cache().Empty(), "Object with a null state should count as unseen.");
    }

    {
        RecordingHost host;
        session::SpawnMailbox mailbox;
        session::SessionDriver driver(host, mailbox);
        (void)driver.Start();
        driver.NotifyTransportClosed();
        passed &= Expect(driver.IsFinished(), "Transport close should finish the session.");
        passed &= Expect(driver.FinishReason() == "transport closed", "Close reason should be recorded.");
        passed &= Expect(!driver.HasRequestInFlight(), "Close should drop the pending request.");
    }

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] replica_session_driver_tests\n";
    return 0;
}
