#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "frostcoord/common/config.hpp"
#include "frostcoord/common/errors.hpp"
#include "frostcoord/crypto/ec_point.hpp"
#include "frostcoord/crypto/encoding.hpp"
#include "frostcoord/crypto/hash.hpp"
#include "frostcoord/crypto/random.hpp"
#include "frostcoord/crypto/scalar.hpp"
#include "frostcoord/crypto/schnorr.hpp"
#include "frostcoord/net/in_memory_publication.hpp"
#include "frostcoord/protocol/coordinator.hpp"
#include "frostcoord/protocol/session.hpp"
#include "frostcoord/store/group_key_directory.hpp"
#include "frostcoord/store/in_memory_session_store.hpp"
#include "frostcoord/store/session_store.hpp"
#include "frostcoord/store/sqlite_database.hpp"
#include "frostcoord/store/sqlite_session_store.hpp"

extern "C" {
#include <secp256k1.h>
}

namespace frostcoord::test {

inline void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

inline void ExpectThrow(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const std::exception&) {
    return;
  }
  throw std::runtime_error("Expected exception: " + message);
}

inline void ExpectError(ErrorKind kind, const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const CoordinatorError& e) {
    if (e.kind() != kind) {
      throw std::runtime_error("Test failed: " + message + " (expected " + ErrorKindName(kind) + ", got " +
                               ErrorKindName(e.kind()) + ": " + e.what() + ")");
    }
    return;
  }
  throw std::runtime_error("Expected " + std::string(ErrorKindName(kind)) + ": " + message);
}

constexpr int64_t kStartMillis = 1700000000000;

// Clock that only moves when told to. Copies share the same time.
class ManualClock {
 public:
  explicit ManualClock(int64_t start_ms = kStartMillis) : now_(std::make_shared<std::atomic<int64_t>>(start_ms)) {}

  Clock AsClock() const {
    auto now = now_;
    return [now]() { return now->load(); };
  }
  void Advance(int64_t delta_ms) { now_->fetch_add(delta_ms); }
  int64_t now() const { return now_->load(); }

 private:
  std::shared_ptr<std::atomic<int64_t>> now_;
};

inline Bytes MessageHash(const std::string& text) {
  const Bytes payload(text.begin(), text.end());
  return Sha256(payload);
}

// Dealer-generated t-of-n sharing of a group secret: share_i = f(i) for a
// random polynomial of degree t-1 with f(0) = secret.
struct TestFederation {
  GroupId group_id;
  std::vector<ParticipantId> participants;
  uint32_t threshold = 1;
  Scalar group_secret;
  ECPoint group_public_key;
  std::map<ParticipantId, Scalar> secret_shares;

  static TestFederation Create(const GroupId& group_id,
                               const std::vector<ParticipantId>& participants,
                               uint32_t threshold) {
    TestFederation federation;
    federation.group_id = group_id;
    federation.participants = participants;
    federation.threshold = threshold;

    std::vector<Scalar> coefficients;
    for (uint32_t i = 0; i < threshold; ++i) {
      coefficients.push_back(Csprng::RandomNonZeroScalar());
    }
    federation.group_secret = coefficients[0];
    federation.group_public_key = ECPoint::GeneratorMultiply(federation.group_secret);

    for (size_t i = 0; i < participants.size(); ++i) {
      const Scalar x = Scalar::FromUint64(i + 1);
      Scalar value;
      Scalar power = Scalar::FromUint64(1);
      for (const Scalar& coefficient : coefficients) {
        value = value + coefficient * power;
        power = power * x;
      }
      federation.secret_shares.emplace(participants[i], value);
    }
    return federation;
  }

  CreateSessionRequest Request(const Bytes& message_hash) const {
    CreateSessionRequest request;
    request.group_id = group_id;
    request.message_hash = message_hash;
    request.participants = participants;
    request.threshold = threshold;
    request.created_by = participants.front();
    return request;
  }
};

struct SignerNonce {
  Scalar k;
  ECPoint R;
  std::string commitment_hex;

  static SignerNonce Generate() {
    SignerNonce nonce;
    nonce.k = Csprng::RandomNonZeroScalar();
    nonce.R = ECPoint::GeneratorMultiply(nonce.k);
    nonce.commitment_hex = EncodePointHex(nonce.R);
    return nonce;
  }
};

// What an honest participant computes in round 2: s_i = k_i + lambda_i*x_i*e
// over the signer set that committed, with BIP-340 parity applied.
inline std::string ComputeShareHex(const TestFederation& federation,
                                   const Session& session,
                                   const ParticipantId& signer,
                                   const std::map<ParticipantId, SignerNonce>& signer_nonces) {
  std::vector<uint32_t> indices;
  std::optional<ECPoint> R;
  for (const auto& [participant_id, nonce] : signer_nonces) {
    indices.push_back(session.ParticipantIndex(participant_id));
    R = R.has_value() ? R->Add(nonce.R) : nonce.R;
  }
  const Scalar e = SchnorrChallenge(*R, federation.group_public_key, session.message_hash);
  const Scalar lambda = LagrangeCoefficientAtZero(session.ParticipantIndex(signer), indices);
  const Scalar share =
      ComputeSignatureShare(signer_nonces.at(signer).k, federation.secret_shares.at(signer), lambda, e, *R,
                            federation.group_public_key);
  return EncodeScalarHex(share);
}

// 130-char SEC1 uncompressed encoding of the same point.
inline std::string UncompressedHex(const ECPoint& point) {
  static secp256k1_context* ctx = secp256k1_context_create(SECP256K1_CONTEXT_VERIFY);
  const Bytes compressed = point.ToCompressedBytes();
  secp256k1_pubkey pubkey;
  if (secp256k1_ec_pubkey_parse(ctx, &pubkey, compressed.data(), compressed.size()) != 1) {
    throw std::runtime_error("failed to parse test point");
  }
  std::array<uint8_t, 65> out{};
  size_t out_len = out.size();
  secp256k1_ec_pubkey_serialize(ctx, out.data(), &out_len, &pubkey, SECP256K1_EC_UNCOMPRESSED);
  return HexEncode(std::span<const uint8_t>(out.data(), out_len));
}

// Flips the lowest bit of the last hex digit.
inline std::string FlipLowBit(const std::string& hex) {
  Bytes raw = HexDecode(hex);
  raw.back() ^= 0x01;
  return HexEncode(raw);
}

inline std::vector<std::pair<std::string, std::function<std::shared_ptr<SessionStore>()>>> StoreBackends() {
  return {
      {"in-memory", []() -> std::shared_ptr<SessionStore> { return std::make_shared<InMemorySessionStore>(); }},
      {"sqlite",
       []() -> std::shared_ptr<SessionStore> {
         auto db = std::make_shared<SqliteDatabase>(":memory:", std::chrono::milliseconds(1000));
         return std::make_shared<SqliteSessionStore>(db);
       }},
  };
}

// Decorator that makes the next `conflicts` optimistic writes lose, as if
// another participant had written first.
class ConflictInjectingStore : public SessionStore {
 public:
  explicit ConflictInjectingStore(std::shared_ptr<SessionStore> inner) : inner_(std::move(inner)) {}

  void InjectConflicts(int conflicts) { pending_conflicts_.store(conflicts); }
  int injected() const { return injected_.load(); }
  // While set, InsertSession fails the way a full disk would.
  void FailInserts(bool fail) { fail_inserts_.store(fail); }

  void RunInTransaction(const std::function<void()>& body) override { inner_->RunInTransaction(body); }
  void InsertSession(const Session& session) override {
    if (fail_inserts_.load()) {
      throw CoordinatorError(ErrorKind::kStorage, "database or disk is full");
    }
    inner_->InsertSession(session);
  }
  std::optional<Session> FindSession(const SessionId& id) override { return inner_->FindSession(id); }
  std::vector<Session> ListSessions(const SessionFilter& filter) override { return inner_->ListSessions(filter); }
  bool UpdateSessionIfUnchanged(const Session& updated, int64_t expected_updated_at) override {
    if (pending_conflicts_.load() > 0) {
      pending_conflicts_.fetch_sub(1);
      injected_.fetch_add(1);
      return false;
    }
    return inner_->UpdateSessionIfUnchanged(updated, expected_updated_at);
  }
  bool UpdateStatusIf(const SessionId& id, SessionStatus expected, SessionStatus next, int64_t now_ms) override {
    return inner_->UpdateStatusIf(id, expected, next, now_ms);
  }
  size_t ExpireSessions(int64_t now_ms, const std::string& reason) override {
    return inner_->ExpireSessions(now_ms, reason);
  }
  size_t DeleteTerminalSessionsCreatedBefore(int64_t cutoff_ms) override {
    return inner_->DeleteTerminalSessionsCreatedBefore(cutoff_ms);
  }
  void InsertNonceCommitment(const NonceCommitmentRecord& record) override { inner_->InsertNonceCommitment(record); }
  bool MarkNonceUsed(const SessionId& session_id,
                     const ParticipantId& participant_id,
                     const std::string& commitment,
                     int64_t now_ms) override {
    return inner_->MarkNonceUsed(session_id, participant_id, commitment, now_ms);
  }
  std::vector<NonceCommitmentRecord> ListNonceCommitments(const SessionId& session_id) override {
    return inner_->ListNonceCommitments(session_id);
  }

 private:
  std::shared_ptr<SessionStore> inner_;
  std::atomic<int> pending_conflicts_{0};
  std::atomic<int> injected_{0};
  std::atomic<bool> fail_inserts_{false};
};

// A coordinator over the given store with in-memory collaborators and a
// manual clock.
struct CoordinatorHarness {
  std::shared_ptr<SessionStore> store;
  std::shared_ptr<InMemoryGroupKeyDirectory> group_keys = std::make_shared<InMemoryGroupKeyDirectory>();
  std::shared_ptr<InMemoryPublicationAdapter> publication = std::make_shared<InMemoryPublicationAdapter>();
  std::shared_ptr<InMemoryNotifier> notifier = std::make_shared<InMemoryNotifier>();
  ManualClock clock;
  std::unique_ptr<FrostCoordinator> coordinator;

  explicit CoordinatorHarness(std::shared_ptr<SessionStore> session_store,
                              CoordinatorConfig config = CoordinatorConfig{},
                              std::shared_ptr<PermissionService> permissions = nullptr,
                              std::shared_ptr<ApprovalAuditService> approvals = nullptr)
      : store(std::move(session_store)) {
    CoordinatorDependencies deps;
    deps.store = store;
    deps.group_keys = group_keys;
    deps.permissions = std::move(permissions);
    deps.approvals = std::move(approvals);
    deps.publication = publication;
    deps.notifier = notifier;
    deps.clock = clock.AsClock();
    coordinator = std::make_unique<FrostCoordinator>(std::move(deps), std::move(config));
  }

  FrostCoordinator* operator->() { return coordinator.get(); }
};

// Runs each test, prints failures, returns the process exit code.
inline int RunTests(const char* suite, const std::vector<std::pair<const char*, std::function<void()>>>& tests) {
  int failures = 0;
  for (const auto& [name, test] : tests) {
    try {
      test();
    } catch (const std::exception& ex) {
      std::cerr << name << ": " << ex.what() << '\n';
      ++failures;
    }
  }
  if (failures != 0) {
    std::cerr << suite << ": " << failures << " test(s) failed" << '\n';
    return 1;
  }
  std::cout << suite << " passed" << '\n';
  return 0;
}

}  // namespace frostcoord::test
