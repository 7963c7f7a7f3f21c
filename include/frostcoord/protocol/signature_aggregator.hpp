#pragma once

#include <memory>

#include "frostcoord/common/bytes.hpp"
#include "frostcoord/crypto/schnorr.hpp"
#include "frostcoord/protocol/session_lifecycle.hpp"
#include "frostcoord/store/group_key_directory.hpp"

namespace frostcoord {

class SignatureAggregator {
 public:
  SignatureAggregator(SessionLifecycle& lifecycle, std::shared_ptr<GroupKeyDirectory> group_keys);

  // s = sum(s_i) mod n and R = sum(R_i) over the participants that supplied
  // shares. Malformed input raises kAggregation and leaves the session in
  // aggregating so an operator can retry or fail it.
  SchnorrSignature AggregateSignatures(const SessionId& session_id);

  bool VerifyAggregatedSignature(const SessionId& session_id, const Bytes& message_hash);

 private:
  SchnorrSignature Combine(const Session& session) const;

  SessionLifecycle& lifecycle_;
  std::shared_ptr<GroupKeyDirectory> group_keys_;
};

}  // namespace frostcoord
