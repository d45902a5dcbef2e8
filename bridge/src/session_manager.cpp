/*
 * 설명: 세션 등록/교체/축출과 클라이언트 상태 기록을 단일 뮤텍스로 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/session_manager_test.cpp
 */
#include "bridge/session_manager.hpp"

#include <algorithm>
#include <initializer_list>

#include "bridge/auth.hpp"
#include "bridge/digest.hpp"

namespace bridge {

namespace {
std::string FirstString(const nlohmann::json& payload, std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    auto it = payload.find(key);
    if (it != payload.end() && it->is_string() && !it->get_ref<const std::string&>().empty()) {
      return it->get<std::string>();
    }
  }
  return {};
}
}  // namespace

SessionIdentity IdentityForClient(const std::string& client_id) {
  return SessionIdentity{client_id, "live2d_session_" + client_id, "live2d_user_" + client_id};
}

std::optional<HandshakeRequest> ValidateHandshake(const nlohmann::json& payload, const std::string& expected_token,
                                                  OpError& error) {
  if (!payload.is_object()) {
    error = {ErrorCode::kInvalidPayload, "핸드셰이크 페이로드가 필요합니다"};
    return std::nullopt;
  }
  HandshakeRequest request;
  request.version = FirstString(payload, {"version"});
  if (request.version.rfind("1.", 0) != 0) {
    error = {ErrorCode::kVersionMismatch, "프로토콜 버전이 호환되지 않습니다. 클라이언트를 업데이트하세요"};
    return std::nullopt;
  }
  if (!TokenMatches(expected_token, FirstString(payload, {"token"}))) {
    error = {ErrorCode::kAuthFailed, "인증 실패"};
    return std::nullopt;
  }
  request.client_id = FirstString(payload, {"clientId", "deviceId", "client"});
  if (request.client_id.empty()) {
    request.client_id = NewUuid();
  }
  request.client_name = FirstString(payload, {"clientName", "name"});
  auto caps = payload.find("capabilities");
  if (caps != payload.end() && caps->is_array()) {
    for (const auto& cap : *caps) {
      if (cap.is_string()) {
        request.capabilities.push_back(cap.get<std::string>());
      }
    }
  }
  return request;
}

SessionManager::SessionManager(SessionLimits limits, std::shared_ptr<Observability> observability)
    : limits_(limits), observability_(std::move(observability)) {}

bool SessionManager::Admit(const SessionIdentity& identity, const HandshakeRequest& handshake,
                           const std::shared_ptr<BridgeConnection>& connection, OpError& error) {
  std::vector<std::pair<std::shared_ptr<BridgeConnection>, std::string>> kicked;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t remaining = sessions_.size() - (sessions_.count(identity.session_id) ? 1 : 0);
    bool over = limits_.max_connections > 0 && remaining >= limits_.max_connections;
    if (over && !limits_.kick_old) {
      error = {ErrorCode::kConnectionFull, "최대 연결 수에 도달했습니다"};
      return false;
    }

    auto same = sessions_.find(identity.session_id);
    if (same != sessions_.end()) {
      if (auto old = same->second.connection.lock()) {
        kicked.emplace_back(std::move(old), "같은 클라이언트의 새 연결로 대체되었습니다");
      }
      sessions_.erase(same);
    }
    while (limits_.max_connections > 0 && sessions_.size() >= limits_.max_connections) {
      auto oldest = std::min_element(sessions_.begin(), sessions_.end(), [](const auto& a, const auto& b) {
        return a.second.info.created_at < b.second.info.created_at;
      });
      if (auto old = oldest->second.connection.lock()) {
        kicked.emplace_back(std::move(old), "새 연결이 들어와 기존 연결을 종료합니다");
      }
      if (observability_) {
        observability_->Info("session_kicked", "가장 오래된 세션을 종료합니다",
                             {{"sessionId", oldest->first}, {"newSessionId", identity.session_id}});
      }
      sessions_.erase(oldest);
    }

    Entry entry;
    entry.info.identity = identity;
    entry.info.client_version = handshake.version;
    entry.info.client_name = handshake.client_name;
    entry.info.capabilities = handshake.capabilities;
    entry.info.created_at = SystemClock::now();
    entry.info.last_seen_at = entry.info.created_at;
    entry.connection = connection;
    entry.raw = connection.get();
    sessions_[identity.session_id] = std::move(entry);
  }
  // 잠금 밖에서 닫아야 기존 연결의 Remove 호출과 교착되지 않는다.
  for (auto& [old, reason] : kicked) {
    old->Kick(reason);
  }
  return true;
}

void SessionManager::Remove(const std::string& session_id, const BridgeConnection* connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return;
  }
  if (it->second.raw == connection) {
    sessions_.erase(it);
  }
}

void SessionManager::Touch(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it != sessions_.end()) {
    it->second.info.last_seen_at = SystemClock::now();
  }
}

void SessionManager::MarkReady(const std::string& session_id, const std::vector<std::string>& capabilities) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return;
  }
  it->second.info.ready = true;
  if (!capabilities.empty()) {
    it->second.info.capabilities = capabilities;
  }
}

void SessionManager::SetPlaying(const std::string& session_id, bool playing) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it != sessions_.end()) {
    it->second.info.playing = playing;
  }
}

void SessionManager::SetClientConfig(const std::string& session_id, const nlohmann::json& config) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it != sessions_.end() && config.is_object()) {
    it->second.info.client_config.update(config);
  }
}

void SessionManager::SetModelInfo(const std::string& session_id, const nlohmann::json& model) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it != sessions_.end()) {
    it->second.info.model_info = model;
  }
}

const SessionManager::Entry* SessionManager::FindLocked(const std::string& target) const {
  auto it = sessions_.find(target);
  if (it != sessions_.end()) {
    return &it->second;
  }
  for (const auto& [id, entry] : sessions_) {
    if (entry.info.identity.user_id == target || entry.info.identity.client_id == target) {
      return &entry;
    }
  }
  return nullptr;
}

SessionInfo SessionManager::InfoLocked(const Entry& entry) const {
  SessionInfo info = entry.info;
  if (auto conn = entry.connection.lock()) {
    info.pending_requests = conn->PendingRequests();
  }
  return info;
}

std::shared_ptr<BridgeConnection> SessionManager::Find(const std::string& target) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto* entry = FindLocked(target);
  if (!entry) {
    return nullptr;
  }
  return entry->connection.lock();
}

std::optional<SessionInfo> SessionManager::Describe(const std::string& target) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto* entry = FindLocked(target);
  if (!entry) {
    return std::nullopt;
  }
  return InfoLocked(*entry);
}

std::vector<SessionInfo> SessionManager::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SessionInfo> out;
  out.reserve(sessions_.size());
  for (const auto& [id, entry] : sessions_) {
    out.push_back(InfoLocked(entry));
  }
  std::sort(out.begin(), out.end(),
            [](const SessionInfo& a, const SessionInfo& b) { return a.created_at < b.created_at; });
  return out;
}

std::size_t SessionManager::ActiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

}  // namespace bridge
