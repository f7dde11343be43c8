#include "session/session_driver.h"

#include "core/logger.h"
#include "mesh/geometry_compiler.h"
#include "session/spawn_planner.h"

#include <utility>

namespace replica::session {

const char* SessionStageName(SessionStage stage) {
    switch (stage) {
        case SessionStage::Idle:
            return "idle";
        case SessionStage::Handshake:
            return "handshake";
        case SessionStage::BootstrapTemplate:
            return "bootstrap_template";
        case SessionStage::SpawnSelf:
            return "spawn_self";
        case SessionStage::SteadyState:
            return "steady_state";
        case SessionStage::Finished:
            return "finished";
    }

    return "unknown";
}

SessionStep SessionStep::Send(std::string request_text) {
    SessionStep step;
    step.kind = Kind::SendRequest;
    step.request = std::move(request_text);
    return step;
}

SessionStep SessionStep::Finish(std::string finish_reason) {
    SessionStep step;
    step.kind = Kind::Finished;
    step.reason = std::move(finish_reason);
    return step;
}

SessionDriver::SessionDriver(ISessionHost& host, SpawnMailbox& spawn_mailbox, SessionOptions options)
    : host_(host),
      spawn_mailbox_(spawn_mailbox),
      options_(std::move(options)) {}

SessionStep SessionDriver::Start() {
    if (stage_ != SessionStage::Idle) {
        return Finish(std::string("start requested in stage ") + SessionStageName(stage_));
    }

    stage_ = SessionStage::Handshake;
    core::Logger::Info("session", "Session started, sending ping.");
    return Issue(protocol::Ping(), &SessionDriver::OnPing);
}

SessionStep SessionDriver::Resume(std::string_view response_text) {
    if (stage_ == SessionStage::Finished) {
        return SessionStep::Finish(finish_reason_);
    }
    if (!pending_) {
        return Finish("reply received with no request in flight");
    }

    auto continuation = std::move(pending_);
    pending_ = nullptr;
    return continuation(response_text);
}

void SessionDriver::NotifyTransportClosed() {
    if (stage_ == SessionStage::Finished) {
        return;
    }

    pending_ = nullptr;
    pending_command_name_.clear();
    stage_ = SessionStage::Finished;
    finish_reason_ = "transport closed";
    core::Logger::Warn("session", "Transport closed, session finished.");
}

SessionStage SessionDriver::Stage() const {
    return stage_;
}

bool SessionDriver::IsFinished() const {
    return stage_ == SessionStage::Finished;
}

bool SessionDriver::HasRequestInFlight() const {
    return static_cast<bool>(pending_);
}

const std::string& SessionDriver::PendingCommandName() const {
    return pending_command_name_;
}

const std::string& SessionDriver::FinishReason() const {
    return finish_reason_;
}

const std::optional<protocol::ObjectId>& SessionDriver::SelfId() const {
    return self_id_;
}

const std::optional<protocol::ObjectId>& SessionDriver::PlayerId() const {
    return player_id_;
}

std::uint64_t SessionDriver::CompletedCycleCount() const {
    return completed_cycle_count_;
}

std::uint64_t SessionDriver::RequestCount() const {
    return request_count_;
}

std::uint64_t SessionDriver::SpawnRequestCount() const {
    return spawn_request_count_;
}

std::uint64_t SessionDriver::RejectedSpawnCount() const {
    return rejected_spawn_count_;
}

std::uint64_t SessionDriver::AbortedReconcileCount() const {
    return aborted_reconcile_count_;
}

const cache::ObjectCache& SessionDriver::Cache() const {
    return cache_;
}

const cache::TemplateResolver& SessionDriver::Templates() const {
    return templates_;
}

template <typename ResultT>
SessionStep SessionDriver::Issue(protocol::Command<ResultT> command, ResultHandler<ResultT> handler) {
    pending_command_name_ = command.name;
    pending_ = [this, name = command.name, decode = std::move(command.decode), handler](
                   std::string_view response_text) {
        pending_command_name_.clear();

        ResultT result{};
        std::string decode_error;
        if (!decode(response_text, result, decode_error)) {
            return Finish("malformed reply to " + name + ": " + decode_error);
        }
        return (this->*handler)(result);
    };

    ++request_count_;
    return SessionStep::Send(std::move(command.request));
}

SessionStep SessionDriver::Finish(std::string reason) {
    pending_ = nullptr;
    pending_command_name_.clear();
    stage_ = SessionStage::Finished;
    finish_reason_ = std::move(reason);
    core::Logger::Error("session", "Session finished: " + finish_reason_);
    return SessionStep::Finish(finish_reason_);
}

SessionStep SessionDriver::OnPing(const protocol::AckResult& result) {
    if (!result.ok) {
        return Finish("ping rejected");
    }

    core::Logger::Info("session", "Ping successful.");
    return Issue(protocol::SetIdentity(std::nullopt), &SessionDriver::OnSetIdentity);
}

SessionStep SessionDriver::OnSetIdentity(const protocol::IdentityResult& result) {
    if (!result.ok) {
        return Finish("identity assignment rejected");
    }

    self_id_ = result.obj_id;
    core::Logger::Info("session", "Controller id: " + self_id_->ToString());

    stage_ = SessionStage::BootstrapTemplate;
    return Issue(
        protocol::AddTemplate(
            options_.controller_template_id,
            options_.controller_collision_shape,
            mesh::BuildCubeVertexBuffer(options_.controller_half_extent)),
        &SessionDriver::OnAddTemplate);
}

SessionStep SessionDriver::OnAddTemplate(const protocol::AckResult& result) {
    if (!result.ok) {
        core::Logger::Warn(
            "session",
            "Controller template " + options_.controller_template_id.ToString() +
                " rejected, continuing.");
    } else {
        core::Logger::Info("session", "Added controller template.");
    }

    stage_ = SessionStage::SpawnSelf;
    return Issue(
        protocol::Spawn(
            options_.controller_template_id,
            options_.self_spawn_position,
            options_.self_spawn_velocity,
            protocol::MakeQuatXyzw(0.0, 0.0, 0.0, 1.0),
            options_.self_spawn_scale,
            options_.self_spawn_inverse_mass),
        &SessionDriver::OnSpawnSelf);
}

SessionStep SessionDriver::OnSpawnSelf(const protocol::SpawnResult& result) {
    if (!result.ok) {
        return Finish("controller spawn rejected");
    }

    player_id_ = result.obj_id;
    core::Logger::Info("session", "Spawned player object " + player_id_->ToString());

    stage_ = SessionStage::SteadyState;
    return BeginCycle();
}

SessionStep SessionDriver::BeginCycle() {
    return Issue(protocol::ListObjectIds(), &SessionDriver::OnObjectList);
}

SessionStep SessionDriver::OnObjectList(const protocol::ObjectListResult& result) {
    if (!result.ok) {
        return Finish("object enumeration rejected");
    }

    cycle_obj_ids_ = result.obj_ids;
    return Issue(protocol::GetStateVariables(cycle_obj_ids_), &SessionDriver::OnStateVariables);
}

SessionStep SessionDriver::OnStateVariables(const protocol::StateVariablesResult& result) {
    if (!result.ok) {
        return Finish("state variable query rejected");
    }
    if (result.sv.size() != cycle_obj_ids_.size()) {
        return Finish(
            "state variable count " + std::to_string(result.sv.size()) +
            " does not match object count " + std::to_string(cycle_obj_ids_.size()));
    }

    cycle_states_ = result.sv;
    reconcile_index_ = 0;
    return ReconcileNext();
}

SessionStep SessionDriver::ReconcileNext() {
    while (reconcile_index_ < cycle_obj_ids_.size()) {
        const protocol::ObjectId& obj_id = cycle_obj_ids_[reconcile_index_];
        if (player_id_.has_value() && obj_id == *player_id_) {
            ++reconcile_index_;
            continue;
        }

        const std::optional<protocol::StateVariable>& live_state = cycle_states_[reconcile_index_].sv;
        if (!live_state.has_value()) {
            core::Logger::Info("cache", "Object " + obj_id.ToString() + " vanished before its state was read.");
            ++reconcile_index_;
            continue;
        }

        const protocol::StateVariable& state = *live_state;
        if (!cache_.UpdateState(obj_id, state)) {
            cache::CacheEntry entry{};
            entry.state = state;
            std::string insert_error;
            if (!cache_.Insert(obj_id, std::move(entry), insert_error)) {
                return Finish(insert_error);
            }
        }

        if (templates_.TryResolveCached(obj_id, cache_) != nullptr) {
            ++reconcile_index_;
            continue;
        }

        const cache::CacheEntry* entry = cache_.Find(obj_id);
        if (entry != nullptr && entry->template_id.has_value()) {
            return Issue(templates_.BeginFetch(*entry->template_id), &SessionDriver::OnTemplate);
        }
        return Issue(templates_.BeginLookup(obj_id), &SessionDriver::OnTemplateId);
    }

    return FinishReconcile();
}

SessionStep SessionDriver::OnTemplateId(const protocol::TemplateIdResult& result) {
    const protocol::ObjectId& obj_id = cycle_obj_ids_[reconcile_index_];
    if (!result.ok) {
        return AbortReconcile("template id lookup rejected for " + obj_id.ToString());
    }

    cache::CacheEntry* entry = cache_.Find(obj_id);
    if (entry == nullptr) {
        return Finish("cache entry vanished during lookup: " + obj_id.ToString());
    }
    entry->template_id = result.template_id;

    const cache::TemplateDescriptor* descriptor = templates_.Find(result.template_id);
    if (descriptor == nullptr) {
        return Issue(templates_.BeginFetch(result.template_id), &SessionDriver::OnTemplate);
    }

    AttachMesh(*entry, *descriptor);
    ++reconcile_index_;
    return ReconcileNext();
}

SessionStep SessionDriver::OnTemplate(const protocol::TemplateResult& result) {
    const protocol::ObjectId& obj_id = cycle_obj_ids_[reconcile_index_];
    cache::CacheEntry* entry = cache_.Find(obj_id);
    if (entry == nullptr || !entry->template_id.has_value()) {
        return Finish("cache entry vanished during template fetch: " + obj_id.ToString());
    }
    if (!result.ok) {
        return AbortReconcile("template fetch rejected for " + entry->template_id->ToString());
    }

    const cache::TemplateDescriptor& descriptor = templates_.Memoize(*entry->template_id, result);
    core::Logger::Info("cache", "Added template " + descriptor.template_id.ToString() + " to cache.");

    AttachMesh(*entry, descriptor);
    ++reconcile_index_;
    return ReconcileNext();
}

// A failed template round-trip ends the cycle before spawn and presentation;
// objects not yet visited keep the previous cycle's state.
SessionStep SessionDriver::AbortReconcile(const std::string& reason) {
    ++aborted_reconcile_count_;
    core::Logger::Warn("session", "Cycle aborted: " + reason);
    SweepCache();
    return BeginCycle();
}

void SessionDriver::AttachMesh(cache::CacheEntry& entry, const cache::TemplateDescriptor& descriptor) {
    mesh::CompiledMesh compiled;
    std::string compile_error;
    if (!mesh::CompileGeometry(descriptor.vertex_buffer, entry.state.scale, compiled, compile_error)) {
        core::Logger::Warn(
            "cache",
            "Template " + descriptor.template_id.ToString() + " geometry not compiled: " + compile_error);
        entry.mesh.reset();
        return;
    }

    entry.mesh = std::move(compiled);
}

void SessionDriver::SweepCache() {
    std::vector<protocol::ObjectId> live_ids;
    live_ids.reserve(cycle_obj_ids_.size());
    for (std::size_t index = 0; index < cycle_obj_ids_.size(); ++index) {
        if (cycle_states_[index].sv.has_value()) {
            live_ids.push_back(cycle_obj_ids_[index]);
        }
    }

    const std::vector<protocol::ObjectId> evicted = cache_.SweepUnseen(live_ids, options_.evict_after_cycles);
    for (const protocol::ObjectId& obj_id : evicted) {
        core::Logger::Info("cache", "Evicted " + obj_id.ToString());
    }
}

SessionStep SessionDriver::FinishReconcile() {
    SweepCache();

    if (!spawn_mailbox_.TryConsume()) {
        return PresentAndSuggest();
    }

    const SpawnPlan plan = PlanSpawn(host_.CurrentViewpoint());
    ++spawn_request_count_;
    return Issue(
        protocol::Spawn(
            options_.controller_template_id,
            plan.position,
            plan.velocity,
            plan.orientation,
            plan.scale,
            plan.inverse_mass),
        &SessionDriver::OnSpawnProjectile);
}

SessionStep SessionDriver::OnSpawnProjectile(const protocol::SpawnResult& result) {
    if (!result.ok) {
        ++rejected_spawn_count_;
        core::Logger::Warn("session", "Spawn request rejected.");
    } else {
        core::Logger::Info("session", "Spawned object " + result.obj_id.ToString());
    }

    return PresentAndSuggest();
}

SessionStep SessionDriver::PresentAndSuggest() {
    host_.PresentFrame(cache_, host_.CurrentViewpoint());

    const Viewpoint viewpoint = host_.CurrentViewpoint();
    return Issue(
        protocol::SuggestPosition(*player_id_, viewpoint.position),
        &SessionDriver::OnSuggestPosition);
}

SessionStep SessionDriver::OnSuggestPosition(const protocol::AckResult& result) {
    (void)result;
    ++completed_cycle_count_;
    return BeginCycle();
}

}  // namespace replica::session
