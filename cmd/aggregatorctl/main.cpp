#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <string>

#include "api/aggregator/v1_grpc.hpp"
#include "internal/fhe/plaintext_backend.hpp"
#include "internal/util/hex.hpp"

using namespace aggregator::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  aggregatorctl <addr> submit <identity> <value>\n"
            << "  aggregatorctl <addr> close <identity>\n"
            << "  aggregatorctl <addr> request <identity> <batch_id>\n"
            << "  aggregatorctl <addr> batch [batch_id]\n"
            << "  aggregatorctl <addr> result <request_id>\n"
            << "  aggregatorctl <addr> deliver <request_id> <cleartext_hex> <attestation_hex>\n"
            << "  aggregatorctl <addr> pending [limit]\n"
            << "  aggregatorctl <addr> stats\n"
            << "  aggregatorctl <addr> events [from_sequence]\n";
}

static uint64_t ParseU64(const char* text) {
  try {
    std::size_t consumed = 0;
    const auto  value    = std::stoull(text, &consumed, 10);
    if (text[consumed] != '\0') throw std::invalid_argument(text);
    return value;
  } catch (const std::exception&) {
    std::cerr << "invalid number: " << text << "\n";
    std::exit(1);
  }
}

static std::string DecodeHexArg(const char* text) {
  try {
    return aggregator::util::FromHex(text);
  } catch (const std::exception& e) {
    std::cerr << "invalid hex: " << e.what() << "\n";
    std::exit(1);
  }
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

static void PrintBatch(const Batch& batch) {
  std::cout << "batch_id=" << batch.id() << " data_count=" << batch.data_count() << " closed=" << (batch.closed() ? "true" : "false") << "\n";
}

static void PrintRequest(const DecryptionRequestInfo& info) {
  std::cout << "request_id=" << info.request_id() << " batch_id=" << info.batch_id() << " requester=" << info.requester()
            << " status=" << DecryptionStatus_Name(info.status()) << " data_count=" << info.data_count()
            << " state_hash=" << aggregator::util::ToHex(info.state_hash());
  if (info.status() == DECRYPTION_STATUS_COMPLETED) {
    std::cout << " average=" << info.average();
  }
  std::cout << "\n";
}

static void PrintEvent(const Event& event) {
  std::cout << "seq=" << event.sequence() << " ";
  switch (event.kind_case()) {
    case Event::kBatchOpened:
      std::cout << "batch_opened batch_id=" << event.batch_opened().batch_id();
      break;
    case Event::kBatchClosed:
      std::cout << "batch_closed batch_id=" << event.batch_closed().batch_id();
      break;
    case Event::kDataSubmitted:
      std::cout << "data_submitted submitter=" << event.data_submitted().submitter() << " batch_id=" << event.data_submitted().batch_id()
                << " index=" << event.data_submitted().index() << " fingerprint=" << aggregator::util::ToHex(event.data_submitted().fingerprint());
      break;
    case Event::kDecryptionRequested:
      std::cout << "decryption_requested request_id=" << event.decryption_requested().request_id()
                << " batch_id=" << event.decryption_requested().batch_id()
                << " commitment=" << aggregator::util::ToHex(event.decryption_requested().commitment());
      break;
    case Event::kDecryptionCompleted:
      std::cout << "decryption_completed request_id=" << event.decryption_completed().request_id()
                << " batch_id=" << event.decryption_completed().batch_id() << " average=" << event.decryption_completed().average();
      break;
    case Event::KIND_NOT_SET:
      std::cout << "unknown";
      break;
  }
  std::cout << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto aggregator_stub = BatchAggregatorService::NewStub(channel);
  auto callback_stub   = OracleCallbackService::NewStub(channel);
  auto admin_stub      = AdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "submit") {
    if (argc < 5) return 1;

    // Development envelope; the server must run the matching backend.
    aggregator::fhe::PlaintextCiphertextBackend backend;

    SubmitRequest req;
    req.set_submitter(argv[3]);
    req.set_ciphertext(backend.Encrypt(ParseU64(argv[4])).bytes);

    SubmitResponse resp;
    auto           status = aggregator_stub->Submit(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "batch_id=" << resp.batch_id() << " index=" << resp.index() << " fingerprint=" << aggregator::util::ToHex(resp.fingerprint()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "close") {
    if (argc < 4) return 1;

    CloseBatchRequest req;
    req.set_caller(argv[3]);

    CloseBatchResponse resp;
    auto               status = aggregator_stub->CloseBatch(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "closed ";
    PrintBatch(resp.closed_batch());
    std::cout << "opened ";
    PrintBatch(resp.opened_batch());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "request") {
    if (argc < 5) return 1;

    RequestAggregateDecryptionRequest req;
    req.set_requester(argv[3]);
    req.set_batch_id(ParseU64(argv[4]));

    RequestAggregateDecryptionResponse resp;
    auto                               status = aggregator_stub->RequestAggregateDecryption(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "request_id=" << resp.request_id() << " commitment=" << aggregator::util::ToHex(resp.commitment()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "batch") {
    GetBatchRequest req;
    if (argc >= 4) req.set_batch_id(ParseU64(argv[3]));

    GetBatchResponse resp;
    auto             status = aggregator_stub->GetBatch(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintBatch(resp.batch());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "result") {
    if (argc < 4) return 1;

    GetDecryptionRequestRequest req;
    req.set_request_id(ParseU64(argv[3]));

    GetDecryptionRequestResponse resp;
    auto                         status = aggregator_stub->GetDecryptionRequest(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintRequest(resp.request());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "deliver") {
    if (argc < 6) return 1;

    DeliverDecryptionResultRequest req;
    req.set_request_id(ParseU64(argv[3]));
    req.set_cleartext(DecodeHexArg(argv[4]));
    req.set_attestation(DecodeHexArg(argv[5]));

    DeliverDecryptionResultResponse resp;
    auto                            status = callback_stub->DeliverDecryptionResult(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "batch_id=" << resp.batch_id() << " average=" << resp.average() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "pending") {
    ListPendingRequestsRequest req;
    if (argc >= 4) req.set_limit(static_cast<uint32_t>(ParseU64(argv[3])));

    ListPendingRequestsResponse resp;
    auto                        status = admin_stub->ListPendingRequests(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& info : resp.requests()) {
      PrintRequest(info);
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;

    auto status = admin_stub->Stats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "open_batch_id=" << resp.open_batch_id() << "\n"
              << "batches=" << resp.batches() << "\n"
              << "submissions=" << resp.submissions() << "\n"
              << "pending_requests=" << resp.pending_requests() << "\n"
              << "completed_requests=" << resp.completed_requests() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "events") {
    ListEventsRequest req;
    if (argc >= 4) req.set_from_sequence(ParseU64(argv[3]));

    ListEventsResponse resp;
    auto               status = admin_stub->ListEvents(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& event : resp.events()) {
      PrintEvent(event);
    }
    std::cout << "next_sequence=" << resp.next_sequence() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
