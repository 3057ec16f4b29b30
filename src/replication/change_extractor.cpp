#include "replication/change_extractor.hpp"

namespace litesync {

ChangeExtractor::ChangeExtractor(std::shared_ptr<PrimaryStore> primary)
    : primary_(std::move(primary)) {}

Result<std::vector<Record>> ChangeExtractor::changes_since(Timestamp cutoff) {
    return primary_->changes_since(cutoff);
}

Result<Timestamp> ChangeExtractor::max_modified_at() {
    return primary_->max_modified_at();
}

} // namespace litesync
