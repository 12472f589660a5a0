#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "aggregator_fixture.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/aggregator_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/oracle_callback_server.hpp"
#include "internal/oracle/cleartext.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/aggregation_service.hpp"
#include "internal/service/oracle_callback_service.hpp"
#include "internal/service/service_context.hpp"

namespace {

using namespace aggregator;
using aggregator::testing::AggregatorFixture;
using aggregator::testing::kOwner;

service::ServiceContext BuildServiceContext(AggregatorFixture& fx, std::shared_ptr<observability::EventJournal> journal = nullptr) {
  service::ServiceContext ctx;
  ctx.aggregator = fx.aggregator;
  ctx.journal    = std::move(journal);
  return ctx;
}

struct Servers {
  explicit Servers(service::ServiceContext ctx)
      : aggregation(std::make_shared<service::AggregationService>(ctx)),
        callback(std::make_shared<service::OracleCallbackService>(ctx)),
        admin(std::make_shared<service::AdminService>(ctx)) {
  }

  aggregator::grpc::AggregatorServer     aggregation;
  aggregator::grpc::OracleCallbackServer callback;
  aggregator::grpc::AdminServer          admin;
};

::grpc::StatusCode Submit(Servers& servers, const std::string& submitter, const std::string& ciphertext) {
  v1::SubmitRequest req;
  req.set_submitter(submitter);
  req.set_ciphertext(ciphertext);
  v1::SubmitResponse    resp;
  ::grpc::ServerContext grpc_ctx;
  return servers.aggregation.Submit(&grpc_ctx, &req, &resp).error_code();
}

::grpc::StatusCode RequestDecryption(Servers& servers, const std::string& requester, uint64_t batch_id) {
  v1::RequestAggregateDecryptionRequest req;
  req.set_requester(requester);
  req.set_batch_id(batch_id);
  v1::RequestAggregateDecryptionResponse resp;
  ::grpc::ServerContext                  grpc_ctx;
  return servers.aggregation.RequestAggregateDecryption(&grpc_ctx, &req, &resp).error_code();
}

::grpc::StatusCode Deliver(Servers& servers, uint64_t request_id, const std::string& cleartext, const std::string& attestation,
                           v1::DeliverDecryptionResultResponse* out = nullptr) {
  v1::DeliverDecryptionResultRequest req;
  req.set_request_id(request_id);
  req.set_cleartext(cleartext);
  req.set_attestation(attestation);
  v1::DeliverDecryptionResultResponse resp;
  ::grpc::ServerContext               grpc_ctx;
  const auto                          status = servers.callback.DeliverDecryptionResult(&grpc_ctx, &req, &resp);
  if (out) *out = resp;
  return status.error_code();
}

void TestSubmissionStatuses() {
  AggregatorFixture fx;
  Servers           servers(BuildServiceContext(fx));

  assert(Submit(servers, "alice", fx.backend->Encrypt(5).bytes) == ::grpc::StatusCode::OK);
  assert(Submit(servers, "mallory", fx.backend->Encrypt(5).bytes) == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(Submit(servers, "alice", "garbage") == ::grpc::StatusCode::INVALID_ARGUMENT);

  fx.access->SetPaused(true);
  assert(Submit(servers, "alice", fx.backend->Encrypt(5).bytes) == ::grpc::StatusCode::UNAVAILABLE);
}

void TestCooldownIsResourceExhausted() {
  aggregator::testing::FixtureOptions options;
  options.submission_cooldown = std::chrono::seconds(10);
  AggregatorFixture fx(options);
  Servers           servers(BuildServiceContext(fx));

  assert(Submit(servers, "bob", fx.backend->Encrypt(1).bytes) == ::grpc::StatusCode::OK);
  assert(Submit(servers, "bob", fx.backend->Encrypt(1).bytes) == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
}

void TestCloseBatchStatuses() {
  AggregatorFixture fx;
  Servers           servers(BuildServiceContext(fx));

  v1::CloseBatchRequest req;
  req.set_caller("alice");
  v1::CloseBatchResponse resp;
  ::grpc::ServerContext  denied_ctx;
  assert(servers.aggregation.CloseBatch(&denied_ctx, &req, &resp).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);

  req.set_caller(kOwner);
  ::grpc::ServerContext ok_ctx;
  assert(servers.aggregation.CloseBatch(&ok_ctx, &req, &resp).ok());
  assert(resp.closed_batch().id() == 1 && resp.closed_batch().closed());
  assert(resp.opened_batch().id() == 2 && !resp.opened_batch().closed());
}

void TestDecryptionStatuses() {
  AggregatorFixture fx;
  Servers           servers(BuildServiceContext(fx));

  assert(RequestDecryption(servers, "alice", 1) == ::grpc::StatusCode::FAILED_PRECONDITION);

  fx.Submit("alice", 9);
  fx.Submit("bob", 3);
  assert(RequestDecryption(servers, "alice", 1) == ::grpc::StatusCode::OK);

  const auto task   = fx.NextTask();
  const auto result = fx.worker->Resolve(task);

  assert(Deliver(servers, 77, result.cleartext, result.attestation) == ::grpc::StatusCode::NOT_FOUND);
  assert(Deliver(servers, task.request_id, result.cleartext, "forged") == ::grpc::StatusCode::UNAUTHENTICATED);

  v1::DeliverDecryptionResultResponse delivered;
  assert(Deliver(servers, task.request_id, result.cleartext, result.attestation, &delivered) == ::grpc::StatusCode::OK);
  assert(delivered.batch_id() == 1);
  assert(delivered.average() == 6);

  assert(Deliver(servers, task.request_id, result.cleartext, result.attestation) == ::grpc::StatusCode::ALREADY_EXISTS);
}

void TestTamperAndMalformedStatuses() {
  AggregatorFixture fx;
  Servers           servers(BuildServiceContext(fx));

  fx.Submit("alice", 9);
  assert(RequestDecryption(servers, "alice", 1) == ::grpc::StatusCode::OK);
  const auto first = fx.NextTask();

  const std::string short_value = "xyz";
  assert(Deliver(servers, first.request_id, short_value, fx.attestor->Sign(first.request_id, short_value)) ==
         ::grpc::StatusCode::INVALID_ARGUMENT);

  fx.Submit("bob", 1);
  const auto result = fx.worker->Resolve(first);
  assert(Deliver(servers, first.request_id, result.cleartext, result.attestation) == ::grpc::StatusCode::ABORTED);
}

void TestQueriesMapMissingToNotFound() {
  AggregatorFixture fx;
  Servers           servers(BuildServiceContext(fx));

  v1::GetBatchRequest batch_req;
  v1::GetBatchResponse batch_resp;
  ::grpc::ServerContext current_ctx;
  assert(servers.aggregation.GetBatch(&current_ctx, &batch_req, &batch_resp).ok());
  assert(batch_resp.batch().id() == 1);

  batch_req.set_batch_id(42);
  ::grpc::ServerContext missing_ctx;
  assert(servers.aggregation.GetBatch(&missing_ctx, &batch_req, &batch_resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  v1::GetDecryptionRequestRequest request_req;
  request_req.set_request_id(5);
  v1::GetDecryptionRequestResponse request_resp;
  ::grpc::ServerContext             request_ctx;
  assert(servers.aggregation.GetDecryptionRequest(&request_ctx, &request_req, &request_resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestAdminSurface() {
  AggregatorFixture fx;
  auto              journal = std::make_shared<observability::EventJournal>(8, fx.clock.Fn());
  Servers           servers(BuildServiceContext(fx, journal));

  fx.Submit("alice", 2);
  fx.aggregator->RequestAggregateDecryption("alice", 1);

  v1::StatsRequest      stats_req;
  v1::StatsResponse     stats;
  ::grpc::ServerContext stats_ctx;
  assert(servers.admin.Stats(&stats_ctx, &stats_req, &stats).ok());
  assert(stats.open_batch_id() == 1);
  assert(stats.submissions() == 1);
  assert(stats.pending_requests() == 1);

  v1::ListPendingRequestsRequest  pending_req;
  v1::ListPendingRequestsResponse pending;
  ::grpc::ServerContext           pending_ctx;
  assert(servers.admin.ListPendingRequests(&pending_ctx, &pending_req, &pending).ok());
  assert(pending.requests_size() == 1);
  assert(pending.requests(0).status() == v1::DECRYPTION_STATUS_PENDING);
  assert(pending.requests(0).requester() == "alice");

  v1::Event opened;
  opened.mutable_batch_opened()->set_batch_id(1);
  journal->Publish(opened);

  v1::ListEventsRequest  events_req;
  v1::ListEventsResponse events;
  ::grpc::ServerContext  events_ctx;
  assert(servers.admin.ListEvents(&events_ctx, &events_req, &events).ok());
  assert(events.events_size() == 1);
  assert(events.events(0).sequence() == 1);
  assert(events.next_sequence() == 2);
}

void TestListEventsWithoutJournal() {
  AggregatorFixture fx;
  Servers           servers(BuildServiceContext(fx));

  v1::ListEventsRequest  req;
  v1::ListEventsResponse resp;
  ::grpc::ServerContext  grpc_ctx;
  assert(servers.admin.ListEvents(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestUnclassifiedErrorsAreInternal() {
  const std::runtime_error error("disk on fire");
  const auto               status = aggregator::grpc::ToStatus(error);
  assert(status.error_code() == ::grpc::StatusCode::INTERNAL);
  assert(status.error_message() == "disk on fire");
}

} // namespace

int main() {
  TestSubmissionStatuses();
  TestCooldownIsResourceExhausted();
  TestCloseBatchStatuses();
  TestDecryptionStatuses();
  TestTamperAndMalformedStatuses();
  TestQueriesMapMissingToNotFound();
  TestAdminSurface();
  TestListEventsWithoutJournal();
  TestUnclassifiedErrorsAreInternal();

  std::cout << "aggregator_unit_grpc_status: pass\n";
  return 0;
}
