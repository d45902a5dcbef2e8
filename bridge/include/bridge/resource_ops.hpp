/*
 * 설명: WebSocket으로 들어온 resource.* 요청을 리소스 저장소 호출로 옮기고 같은 op/id로 응답 패킷을 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/resource_ops_test.cpp, bridge/tests/e2e/resource_transfer_test.cpp
 */
#pragma once

#include <memory>
#include <optional>

#include "bridge/observability.hpp"
#include "bridge/protocol.hpp"
#include "bridge/resource_store.hpp"

namespace bridge {

nlohmann::json ToJson(const UploadTarget& target);
nlohmann::json ToJson(const ResourceReference& reference);

class ResourceOpHandler {
 public:
  ResourceOpHandler(std::shared_ptr<ResourceStore> store, std::shared_ptr<Observability> observability = nullptr);

  // resource.progress처럼 응답이 필요 없는 op면 nullopt. 실패는 sys.error 패킷으로 돌려준다.
  std::optional<Packet> Handle(const Packet& request) const;

 private:
  Packet HandlePrepare(const Packet& request) const;
  Packet HandleCommit(const Packet& request) const;
  Packet HandleGet(const Packet& request) const;
  Packet HandleRelease(const Packet& request) const;
  void HandleProgress(const Packet& request) const;

  std::shared_ptr<ResourceStore> store_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace bridge
