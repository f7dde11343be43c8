#pragma once

#include "cache/object_cache.h"
#include "cache/template_resolver.h"
#include "protocol/command_catalog.h"
#include "protocol/composite_id.h"
#include "session/spawn_mailbox.h"
#include "session/viewpoint.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace replica::session {

enum class SessionStage : std::uint8_t {
    Idle = 0,
    Handshake = 1,
    BootstrapTemplate = 2,
    SpawnSelf = 3,
    SteadyState = 4,
    Finished = 5,
};

const char* SessionStageName(SessionStage stage);

struct SessionStep final {
    enum class Kind : std::uint8_t {
        SendRequest,
        Finished,
    };

    Kind kind = Kind::Finished;
    std::string request;
    std::string reason;

    static SessionStep Send(std::string request_text);
    static SessionStep Finish(std::string finish_reason);

    bool IsSend() const {
        return kind == Kind::SendRequest;
    }
};

// Presentation side of the session: supplies the local viewpoint and receives
// one frame per steady state cycle.
class ISessionHost {
public:
    virtual ~ISessionHost() = default;

    virtual Viewpoint CurrentViewpoint() const = 0;
    virtual void PresentFrame(const cache::ObjectCache& cache, const Viewpoint& viewpoint) = 0;
};

struct SessionOptions final {
    protocol::TemplateId controller_template_id{111, 108, 105};
    protocol::CollisionShape controller_collision_shape = protocol::kDynamicCollisionShape;
    float controller_half_extent = 0.5F;
    protocol::Vec3 self_spawn_position = protocol::Vec3(0.0, 0.0, 0.0);
    protocol::Vec3 self_spawn_velocity = protocol::Vec3(0.0, 0.0, 50.0);
    double self_spawn_scale = 1.0;
    double self_spawn_inverse_mass = 1.0;
    // Zero keeps entries for the whole session.
    std::uint32_t evict_after_cycles = 0;
};

// Cooperative client state machine. Every call to Start/Resume returns the
// next request to send or the reason the session ended. At most one request
// is outstanding: Resume must be fed the reply to the request returned last.
class SessionDriver final {
public:
    SessionDriver(ISessionHost& host, SpawnMailbox& spawn_mailbox, SessionOptions options = {});

    SessionDriver(const SessionDriver&) = delete;
    SessionDriver& operator=(const SessionDriver&) = delete;

    SessionStep Start();
    SessionStep Resume(std::string_view response_text);
    void NotifyTransportClosed();

    SessionStage Stage() const;
    bool IsFinished() const;
    bool HasRequestInFlight() const;
    const std::string& PendingCommandName() const;
    const std::string& FinishReason() const;

    const std::optional<protocol::ObjectId>& SelfId() const;
    const std::optional<protocol::ObjectId>& PlayerId() const;
    std::uint64_t CompletedCycleCount() const;
    std::uint64_t RequestCount() const;
    std::uint64_t SpawnRequestCount() const;
    std::uint64_t RejectedSpawnCount() const;
    std::uint64_t AbortedReconcileCount() const;

    const cache::ObjectCache& Cache() const;
    const cache::TemplateResolver& Templates() const;

private:
    template <typename ResultT>
    using ResultHandler = SessionStep (SessionDriver::*)(const ResultT&);

    template <typename ResultT>
    SessionStep Issue(protocol::Command<ResultT> command, ResultHandler<ResultT> handler);

    SessionStep Finish(std::string reason);

    SessionStep OnPing(const protocol::AckResult& result);
    SessionStep OnSetIdentity(const protocol::IdentityResult& result);
    SessionStep OnAddTemplate(const protocol::AckResult& result);
    SessionStep OnSpawnSelf(const protocol::SpawnResult& result);

    SessionStep BeginCycle();
    SessionStep OnObjectList(const protocol::ObjectListResult& result);
    SessionStep OnStateVariables(const protocol::StateVariablesResult& result);
    SessionStep ReconcileNext();
    SessionStep OnTemplateId(const protocol::TemplateIdResult& result);
    SessionStep OnTemplate(const protocol::TemplateResult& result);
    SessionStep AbortReconcile(const std::string& reason);
    void AttachMesh(cache::CacheEntry& entry, const cache::TemplateDescriptor& descriptor);
    void SweepCache();
    SessionStep FinishReconcile();
    SessionStep OnSpawnProjectile(const protocol::SpawnResult& result);
    SessionStep PresentAndSuggest();
    SessionStep OnSuggestPosition(const protocol::AckResult& result);

    ISessionHost& host_;
    SpawnMailbox& spawn_mailbox_;
    SessionOptions options_;

    SessionStage stage_ = SessionStage::Idle;
    std::function<SessionStep(std::string_view)> pending_;
    std::string pending_command_name_;
    std::string finish_reason_;

    std::optional<protocol::ObjectId> self_id_;
    std::optional<protocol::ObjectId> player_id_;
    cache::ObjectCache cache_;
    cache::TemplateResolver templates_;

    std::vector<protocol::ObjectId> cycle_obj_ids_;
    std::vector<protocol::StateVariableRecord> cycle_states_;
    std::size_t reconcile_index_ = 0;

    std::uint64_t completed_cycle_count_ = 0;
    std::uint64_t request_count_ = 0;
    std::uint64_t spawn_request_count_ = 0;
    std::uint64_t rejected_spawn_count_ = 0;
    std::uint64_t aborted_reconcile_count_ = 0;
};

}  // namespace replica::session
