#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "store/primary_store.hpp"
#include <memory>
#include <vector>

namespace litesync {

/**
 * @brief Reads the primary for rows changed after a watermark
 *
 * Pure read against the primary; holds no state between calls.
 */
class ChangeExtractor {
public:
    explicit ChangeExtractor(std::shared_ptr<PrimaryStore> primary);

    /**
     * @brief Every record with modified_at > cutoff
     *
     * Ordered by modified_at ascending, ties by id then collection, so
     * applying the batch in order leaves the newest version last.
     */
    [[nodiscard]] Result<std::vector<Record>> changes_since(Timestamp cutoff);

    /// Highest modified_at on the primary, 0 when empty
    [[nodiscard]] Result<Timestamp> max_modified_at();

private:
    std::shared_ptr<PrimaryStore> primary_;
};

} // namespace litesync
