#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "frostcoord/common/errors.hpp"
#include "frostcoord/crypto/schnorr.hpp"
#include "frostcoord/protocol/coordinator.hpp"
#include "frostcoord/store/sqlite_backend.hpp"
#include "test_support.hpp"

namespace {

using frostcoord::CompletionNotice;
using frostcoord::CoordinatorConfig;
using frostcoord::CoordinatorDependencies;
using frostcoord::ErrorKind;
using frostcoord::FrostCoordinator;
using frostcoord::InMemoryGroupKeyDirectory;
using frostcoord::InMemoryNotifier;
using frostcoord::InMemoryPublicationAdapter;
using frostcoord::InMemorySessionStore;
using frostcoord::SchnorrSignature;
using frostcoord::Session;
using frostcoord::SessionStatus;
using frostcoord::SqliteBackend;
using frostcoord::test::ComputeShareHex;
using frostcoord::test::CoordinatorHarness;
using frostcoord::test::Expect;
using frostcoord::test::ExpectError;
using frostcoord::test::FlipLowBit;
using frostcoord::test::ManualClock;
using frostcoord::test::MessageHash;
using frostcoord::test::SignerNonce;
using frostcoord::test::StoreBackends;
using frostcoord::test::TestFederation;

const char* kTemplate = R"({"kind":1,"content":"federation announcement"})";

// Runs both rounds for `signers` and returns the session left in
// aggregating. `overrides` replaces the named signers' shares.
Session RunRounds(FrostCoordinator& coordinator,
                  const TestFederation& federation,
                  const std::vector<std::string>& signers,
                  const std::string& message,
                  const std::map<std::string, std::string>& overrides = {}) {
  auto request = federation.Request(MessageHash(message));
  request.message_template = kTemplate;
  const Session created = coordinator.CreateSession(request);

  std::map<std::string, SignerNonce> nonces;
  for (const auto& signer : signers) {
    nonces.emplace(signer, SignerNonce::Generate());
    (void)coordinator.SubmitNonceCommitment(created.id, signer, nonces.at(signer).commitment_hex);
  }
  const Session signing = coordinator.GetSession(created.id);
  for (const auto& signer : signers) {
    const auto override_it = overrides.find(signer);
    const std::string share = override_it != overrides.end() ? override_it->second
                                                              : ComputeShareHex(federation, signing, signer, nonces);
    (void)coordinator.SubmitPartialSignature(created.id, signer, share);
  }
  return coordinator.GetSession(created.id);
}

void TestRoundTripVerifies() {
  for (const auto& [name, make] : StoreBackends()) {
    CoordinatorHarness h(make());
    const TestFederation federation = TestFederation::Create("fed-abc", {"A", "B", "C"}, 2);
    h.group_keys->RegisterGroupKey(federation.group_id, federation.group_public_key);

    const Session aggregating = RunRounds(*h.coordinator, federation, {"A", "B"}, "round trip");
    Expect(aggregating.status == SessionStatus::kAggregating, name + ": shares at threshold claim aggregation");

    h.clock.Advance(25);
    const SchnorrSignature signature = h->AggregateSignatures(aggregating.id);
    const Session completed = h->GetSession(aggregating.id);
    Expect(completed.status == SessionStatus::kCompleted, name + ": aggregation completes the session");
    Expect(completed.completed_at.has_value() && *completed.completed_at == h.clock.now(),
           name + ": completion time recorded");
    Expect(completed.final_signature.has_value() && completed.final_signature->R == signature.R &&
               completed.final_signature->s == signature.s,
           name + ": stored signature equals the returned one");
    Expect(frostcoord::VerifySchnorr(federation.group_public_key, completed.message_hash, signature),
           name + ": signature verifies under the group key");
    Expect(h->VerifyAggregatedSignature(aggregating.id, MessageHash("round trip")), name + ": verify returns true");
    Expect(!h->VerifyAggregatedSignature(aggregating.id, MessageHash("another message")),
           name + ": signature does not cover another message");

    ExpectError(ErrorKind::kState, [&]() { (void)h->AggregateSignatures(aggregating.id); },
                name + ": completed session cannot be aggregated twice");
  }
}

void TestSqliteBackendRoundTrip() {
  CoordinatorConfig config;
  config.db_path = ":memory:";
  SqliteBackend backend = SqliteBackend::Open(config);

  ManualClock clock;
  CoordinatorDependencies deps;
  deps.store = backend.sessions;
  deps.group_keys = backend.group_keys;
  deps.approvals = backend.approvals;
  deps.publication = std::make_shared<InMemoryPublicationAdapter>();
  deps.clock = clock.AsClock();
  FrostCoordinator coordinator(deps, config);

  const TestFederation federation = TestFederation::Create("fed-sqlite", {"A", "B", "C"}, 3);
  backend.group_keys->RegisterGroupKey(federation.group_id, federation.group_public_key, clock.now());

  const Session aggregating = RunRounds(coordinator, federation, {"A", "B", "C"}, "sqlite backend");
  (void)coordinator.AggregateSignatures(aggregating.id);
  Expect(coordinator.VerifyAggregatedSignature(aggregating.id, MessageHash("sqlite backend")),
         "3-of-3 signature verifies against the persisted group key");

  const std::string publication_id = coordinator.PublishCompletedSession(aggregating.id);
  Expect(coordinator.GetSession(aggregating.id).publication_id == std::optional<std::string>(publication_id),
         "publication id persisted");
}

void TestThresholdOfOne() {
  for (const auto& [name, make] : StoreBackends()) {
    CoordinatorHarness h(make());
    const TestFederation federation = TestFederation::Create("fed-solo", {"A", "B"}, 1);
    h.group_keys->RegisterGroupKey(federation.group_id, federation.group_public_key);

    const Session aggregating = RunRounds(*h.coordinator, federation, {"B"}, "single signer");
    Expect(aggregating.status == SessionStatus::kAggregating, name + ": one share is enough");
    (void)h->AggregateSignatures(aggregating.id);
    Expect(h->VerifyAggregatedSignature(aggregating.id, MessageHash("single signer")),
           name + ": 1-of-2 signature verifies");
  }
}

void TestTamperedShareFailsVerification() {
  for (const auto& [name, make] : StoreBackends()) {
    CoordinatorHarness h(make());
    const TestFederation federation = TestFederation::Create("fed-abc", {"A", "B", "C"}, 2);
    h.group_keys->RegisterGroupKey(federation.group_id, federation.group_public_key);

    const Session created = h->CreateSession(federation.Request(MessageHash("tampered")));
    std::map<std::string, SignerNonce> nonces = {{"A", SignerNonce::Generate()}, {"B", SignerNonce::Generate()}};
    (void)h->SubmitNonceCommitment(created.id, "A", nonces["A"].commitment_hex);
    (void)h->SubmitNonceCommitment(created.id, "B", nonces["B"].commitment_hex);
    const Session signing = h->GetSession(created.id);
    (void)h->SubmitPartialSignature(created.id, "A", ComputeShareHex(federation, signing, "A", nonces));
    (void)h->SubmitPartialSignature(created.id, "B", FlipLowBit(ComputeShareHex(federation, signing, "B", nonces)));

    (void)h->AggregateSignatures(created.id);
    Expect(h->GetSession(created.id).status == SessionStatus::kCompleted,
           name + ": aggregation does not check share validity");
    Expect(!h->VerifyAggregatedSignature(created.id, MessageHash("tampered")),
           name + ": one flipped bit breaks verification");
  }
}

void TestInsufficientShares() {
  for (const auto& [name, make] : StoreBackends()) {
    CoordinatorHarness h(make());
    const TestFederation federation = TestFederation::Create("fed-abc", {"A", "B", "C"}, 2);
    const Session created = h->CreateSession(federation.Request(MessageHash("short")));
    std::map<std::string, SignerNonce> nonces = {{"A", SignerNonce::Generate()}, {"B", SignerNonce::Generate()}};
    (void)h->SubmitNonceCommitment(created.id, "A", nonces["A"].commitment_hex);
    (void)h->SubmitNonceCommitment(created.id, "B", nonces["B"].commitment_hex);
    const Session signing = h->GetSession(created.id);
    (void)h->SubmitPartialSignature(created.id, "A", ComputeShareHex(federation, signing, "A", nonces));

    ExpectError(ErrorKind::kState, [&]() { (void)h->AggregateSignatures(created.id); },
                name + ": signing session is not aggregating");

    // Forced past the collector, as a buggy or racing writer could.
    Expect(h.store->UpdateStatusIf(created.id, SessionStatus::kSigning, SessionStatus::kAggregating, h.clock.now()),
           name + ": status forced to aggregating");
    ExpectError(ErrorKind::kAggregation, [&]() { (void)h->AggregateSignatures(created.id); },
                name + ": one share below threshold");
    Expect(h->GetSession(created.id).status == SessionStatus::kAggregating, name + ": failed aggregation writes nothing");
  }
}

void TestMalformedShareLeavesSessionAggregating() {
  for (const auto& [name, make] : StoreBackends()) {
    CoordinatorHarness h(make());
    const TestFederation federation = TestFederation::Create("fed-abc", {"A", "B", "C"}, 2);
    const Session aggregating =
        RunRounds(*h.coordinator, federation, {"A", "B"}, "malformed", {{"B", "not-a-scalar"}});
    Expect(aggregating.status == SessionStatus::kAggregating, name + ": malformed share still counts");

    ExpectError(ErrorKind::kAggregation, [&]() { (void)h->AggregateSignatures(aggregating.id); },
                name + ": malformed share cannot be combined");
    ExpectError(ErrorKind::kAggregation, [&]() { (void)h->AggregateSignatures(aggregating.id); },
                name + ": retrying aggregation fails the same way");
    const Session after = h->GetSession(aggregating.id);
    Expect(after.status == SessionStatus::kAggregating && !after.final_signature.has_value(),
           name + ": no partial result persisted");

    const Session failed = h->FailSession(aggregating.id, "bad share from B");
    Expect(failed.status == SessionStatus::kFailed, name + ": caller can fail the stuck session");
    Expect(failed.error_message == std::optional<std::string>("bad share from B"), name + ": reason kept");

    const std::vector<CompletionNotice> notices = h.notifier->delivered();
    Expect(notices.size() == 1 && notices[0].status == SessionStatus::kFailed &&
               !notices[0].publication_id.has_value() && notices[0].recipients == after.participants,
           name + ": participants told about the failure");
  }
}

void TestZeroShareRejected() {
  CoordinatorHarness h(std::make_shared<InMemorySessionStore>());
  const TestFederation federation = TestFederation::Create("fed-abc", {"A", "B", "C"}, 2);
  const Session aggregating =
      RunRounds(*h.coordinator, federation, {"A", "B"}, "zero share", {{"A", std::string(64, '0')}});
  ExpectError(ErrorKind::kAggregation, [&]() { (void)h->AggregateSignatures(aggregating.id); },
              "zero share is rejected at aggregation");
}

void TestVerificationPreconditions() {
  CoordinatorHarness h(std::make_shared<InMemorySessionStore>());
  const TestFederation federation = TestFederation::Create("fed-abc", {"A", "B", "C"}, 2);
  const Session aggregating = RunRounds(*h.coordinator, federation, {"A", "C"}, "preconditions");

  ExpectError(ErrorKind::kState,
              [&]() { (void)h->VerifyAggregatedSignature(aggregating.id, MessageHash("preconditions")); },
              "no signature before completion");
  ExpectError(ErrorKind::kNotFound,
              [&]() { (void)h->VerifyAggregatedSignature("missing-session", MessageHash("preconditions")); },
              "unknown session");

  (void)h->AggregateSignatures(aggregating.id);
  ExpectError(ErrorKind::kNotFound,
              [&]() { (void)h->VerifyAggregatedSignature(aggregating.id, MessageHash("preconditions")); },
              "group key not registered");
  ExpectError(ErrorKind::kValidation,
              [&]() { (void)h->VerifyAggregatedSignature(aggregating.id, frostcoord::Bytes(31, 0x01)); },
              "short message hash");

  const TestFederation other = TestFederation::Create("fed-abc", {"A", "B", "C"}, 2);
  h.group_keys->RegisterGroupKey(federation.group_id, other.group_public_key);
  Expect(!h->VerifyAggregatedSignature(aggregating.id, MessageHash("preconditions")),
         "signature does not verify under an unrelated key");
  h.group_keys->RegisterGroupKey(federation.group_id, federation.group_public_key);
  Expect(h->VerifyAggregatedSignature(aggregating.id, MessageHash("preconditions")),
         "signature verifies once the right key is registered");
}

void TestPublishCompletedSession() {
  for (const auto& [name, make] : StoreBackends()) {
    CoordinatorHarness h(make());
    const TestFederation federation = TestFederation::Create("fed-abc", {"A", "B", "C"}, 2);
    h.group_keys->RegisterGroupKey(federation.group_id, federation.group_public_key);
    const Session aggregating = RunRounds(*h.coordinator, federation, {"A", "B"}, "publish");

    ExpectError(ErrorKind::kState, [&]() { (void)h->PublishCompletedSession(aggregating.id); },
                name + ": cannot publish before completion");
    const SchnorrSignature signature = h->AggregateSignatures(aggregating.id);

    int handled = 0;
    h.notifier->RegisterHandler([&](const CompletionNotice&) { ++handled; });
    const std::string publication_id = h->PublishCompletedSession(aggregating.id);
    Expect(publication_id == "publication-1", name + ": adapter id returned");

    const auto published = h.publication->published();
    Expect(published.size() == 1, name + ": adapter called once");
    Expect(published[0].session_id == aggregating.id && published[0].group_id == federation.group_id,
           name + ": request names the session and group");
    Expect(published[0].group_public_key == federation.group_public_key, name + ": request carries the group key");
    Expect(published[0].final_signature.R == signature.R && published[0].final_signature.s == signature.s,
           name + ": request carries the final signature");
    Expect(published[0].message_template == kTemplate, name + ": request carries the template");

    const Session completed = h->GetSession(aggregating.id);
    Expect(completed.publication_id == std::optional<std::string>(publication_id), name + ": publication id stored");
    Expect(completed.status == SessionStatus::kCompleted, name + ": publication keeps the session completed");

    const auto notices = h.notifier->delivered();
    Expect(notices.size() == 1 && handled == 1, name + ": exactly one completion notice");
    Expect(notices[0].status == SessionStatus::kCompleted &&
               notices[0].publication_id == std::optional<std::string>(publication_id) &&
               notices[0].recipients == completed.participants,
           name + ": notice carries the publication id to every participant");

    ExpectError(ErrorKind::kState, [&]() { (void)h->PublishCompletedSession(aggregating.id); },
                name + ": a session is published once");
    Expect(h.publication->published().size() == 1, name + ": second attempt never reaches the adapter");
  }
}

void TestPublicationFailure() {
  CoordinatorHarness h(std::make_shared<InMemorySessionStore>());
  const TestFederation federation = TestFederation::Create("fed-abc", {"A", "B", "C"}, 2);
  h.group_keys->RegisterGroupKey(federation.group_id, federation.group_public_key);
  const Session aggregating = RunRounds(*h.coordinator, federation, {"B", "C"}, "relay down");
  (void)h->AggregateSignatures(aggregating.id);

  h.publication->SetFailure(std::string("relay unreachable"));
  ExpectError(ErrorKind::kPublication, [&]() { (void)h->PublishCompletedSession(aggregating.id); },
              "adapter failure surfaces as a publication error");
  Expect(!h->GetSession(aggregating.id).publication_id.has_value(), "failed publication records nothing");
  Expect(h.notifier->delivered().empty(), "no notice for a failed publication");

  h.publication->SetFailure(std::nullopt);
  Expect(!h->PublishCompletedSession(aggregating.id).empty(), "publication can be retried");
}

void TestNotifierFailureDoesNotFailPublication() {
  CoordinatorHarness h(std::make_shared<InMemorySessionStore>());
  const TestFederation federation = TestFederation::Create("fed-abc", {"A", "B", "C"}, 2);
  h.group_keys->RegisterGroupKey(federation.group_id, federation.group_public_key);
  const Session aggregating = RunRounds(*h.coordinator, federation, {"A", "B"}, "notifier down");
  (void)h->AggregateSignatures(aggregating.id);

  h.notifier->RegisterHandler([](const CompletionNotice&) { throw std::runtime_error("mailbox full"); });
  const std::string publication_id = h->PublishCompletedSession(aggregating.id);
  Expect(h->GetSession(aggregating.id).publication_id == std::optional<std::string>(publication_id),
         "publication recorded despite notifier failure");
}

void TestFailureNoticeWithoutPublicationAdapter() {
  auto notifier = std::make_shared<InMemoryNotifier>();
  ManualClock clock;
  CoordinatorDependencies deps;
  deps.store = std::make_shared<InMemorySessionStore>();
  deps.group_keys = std::make_shared<InMemoryGroupKeyDirectory>();
  deps.notifier = notifier;
  deps.clock = clock.AsClock();
  FrostCoordinator coordinator(deps, CoordinatorConfig{});

  const TestFederation federation = TestFederation::Create("fed-abc", {"A", "B", "C"}, 2);
  const Session created = coordinator.CreateSession(federation.Request(MessageHash("no relay configured")));
  (void)coordinator.FailSession(created.id, "operator abort");

  const auto notices = notifier->delivered();
  Expect(notices.size() == 1, "failure notice sent without a publication adapter");
  Expect(notices[0].session_id == created.id && notices[0].status == SessionStatus::kFailed &&
             !notices[0].publication_id.has_value() && notices[0].recipients == created.participants,
         "notice names the failed session and its participants");

  const Session second = coordinator.CreateSession(federation.Request(MessageHash("mailbox down")));
  notifier->RegisterHandler([](const CompletionNotice&) { throw std::runtime_error("mailbox full"); });
  const Session failed = coordinator.FailSession(second.id, "operator abort");
  Expect(failed.status == SessionStatus::kFailed, "notifier failure does not undo the failure");
}

// Aggregate signatures verify whichever y parity the aggregate nonce and the
// group key happen to have.
void TestSignaturesVerifyForEveryParity() {
  for (const bool even_y : {true, false}) {
    TestFederation federation = TestFederation::Create("fed-parity", {"A", "B", "C"}, 2);
    while (federation.group_public_key.HasEvenY() != even_y) {
      federation = TestFederation::Create("fed-parity", {"A", "B", "C"}, 2);
    }
    for (const bool even_r : {true, false}) {
      const std::string label = std::string(even_r ? "even" : "odd") + " R, " + (even_y ? "even" : "odd") + " Y";
      CoordinatorHarness h(std::make_shared<InMemorySessionStore>());
      h.group_keys->RegisterGroupKey(federation.group_id, federation.group_public_key);

      std::map<std::string, SignerNonce> nonces;
      do {
        nonces = {{"A", SignerNonce::Generate()}, {"C", SignerNonce::Generate()}};
      } while (nonces["A"].R.Add(nonces["C"].R).HasEvenY() != even_r);

      const Session created = h->CreateSession(federation.Request(MessageHash(label)));
      (void)h->SubmitNonceCommitment(created.id, "A", nonces["A"].commitment_hex);
      (void)h->SubmitNonceCommitment(created.id, "C", nonces["C"].commitment_hex);
      const Session signing = h->GetSession(created.id);
      (void)h->SubmitPartialSignature(created.id, "A", ComputeShareHex(federation, signing, "A", nonces));
      (void)h->SubmitPartialSignature(created.id, "C", ComputeShareHex(federation, signing, "C", nonces));

      const SchnorrSignature signature = h->AggregateSignatures(created.id);
      Expect(signature.R.HasEvenY() == even_r, label + ": aggregate nonce has the chosen parity");
      Expect(h->VerifyAggregatedSignature(created.id, MessageHash(label)), label + ": signature verifies");
    }
  }
}

void TestPublicationNeedsTemplate() {
  CoordinatorHarness h(std::make_shared<InMemorySessionStore>());
  const TestFederation federation = TestFederation::Create("fed-abc", {"A", "B", "C"}, 2);
  h.group_keys->RegisterGroupKey(federation.group_id, federation.group_public_key);

  const Session created = h->CreateSession(federation.Request(MessageHash("no template")));
  std::map<std::string, SignerNonce> nonces = {{"A", SignerNonce::Generate()}, {"B", SignerNonce::Generate()}};
  (void)h->SubmitNonceCommitment(created.id, "A", nonces["A"].commitment_hex);
  (void)h->SubmitNonceCommitment(created.id, "B", nonces["B"].commitment_hex);
  const Session signing = h->GetSession(created.id);
  (void)h->SubmitPartialSignature(created.id, "A", ComputeShareHex(federation, signing, "A", nonces));
  (void)h->SubmitPartialSignature(created.id, "B", ComputeShareHex(federation, signing, "B", nonces));
  (void)h->AggregateSignatures(created.id);

  ExpectError(ErrorKind::kValidation, [&]() { (void)h->PublishCompletedSession(created.id); },
              "nothing to publish without a template");
  Expect(h.publication->published().empty(), "adapter not called");
}

}  // namespace

int main() {
  return frostcoord::test::RunTests("aggregation tests",
                                    {
                                        {"RoundTripVerifies", TestRoundTripVerifies},
                                        {"SqliteBackendRoundTrip", TestSqliteBackendRoundTrip},
                                        {"ThresholdOfOne", TestThresholdOfOne},
                                        {"TamperedShareFailsVerification", TestTamperedShareFailsVerification},
                                        {"InsufficientShares", TestInsufficientShares},
                                        {"MalformedShareLeavesSessionAggregating",
                                         TestMalformedShareLeavesSessionAggregating},
                                        {"ZeroShareRejected", TestZeroShareRejected},
                                        {"VerificationPreconditions", TestVerificationPreconditions},
                                        {"PublishCompletedSession", TestPublishCompletedSession},
                                        {"PublicationFailure", TestPublicationFailure},
                                        {"NotifierFailureDoesNotFailPublication",
                                         TestNotifierFailureDoesNotFailPublication},
                                        {"PublicationNeedsTemplate", TestPublicationNeedsTemplate},
                                        {"FailureNoticeWithoutPublicationAdapter",
                                         TestFailureNoticeWithoutPublicationAdapter},
                                        {"SignaturesVerifyForEveryParity", TestSignaturesVerifyForEveryParity},
                                    });
}
