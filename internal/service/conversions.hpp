#pragma once

#include "aggregator/v1/types.pb.h"
#include "internal/db/model/batch_record.hpp"
#include "internal/db/model/decryption_context_record.hpp"

namespace aggregator::service {

aggregator::v1::Batch                 ToProto(const db::model::BatchRecord& record);
aggregator::v1::DecryptionRequestInfo ToProto(const db::model::DecryptionContextRecord& record);

} // namespace aggregator::service
