#pragma once

#include "dump/statement_source.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mysql2pg::testing {

/**
 * @brief Statement source over a fixed list, optionally ending in an error
 */
class VectorStatementSource : public IStatementSource {
public:
    explicit VectorStatementSource(std::vector<std::string> texts,
                                   std::optional<std::string> trailing_error = std::nullopt)
        : texts_(std::move(texts)), trailing_error_(std::move(trailing_error)) {}

    [[nodiscard]] ExtractStep next() override {
        if (pos_ < texts_.size()) {
            const auto index = pos_;
            return ExtractStep::of(RewrittenStatement{texts_[pos_++], index, index + 1});
        }
        if (trailing_error_) {
            auto message = std::move(*trailing_error_);
            trailing_error_.reset();
            return ExtractStep::error(std::move(message));
        }
        return ExtractStep::end();
    }

private:
    std::vector<std::string> texts_;
    std::optional<std::string> trailing_error_;
    size_t pos_ = 0;
};

} // namespace mysql2pg::testing
