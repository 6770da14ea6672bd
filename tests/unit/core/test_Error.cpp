#include "core/Error.hpp"

#include <doctest/doctest.h>

#include <vector>

using namespace PK;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::InvalidError);
             i <= static_cast<int>(Error::Code::InvalidArgument);
             ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::RelativePath, "mydir"};
        CHECK(describeError(withMsg) == "relative_path:mydir");

        Error withoutMsg{Error::Code::EmptyPath, {}};
        CHECK(describeError(withoutMsg) == "empty_path");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }

    TEST_CASE("Expected carries either value or error") {
        Expected<int> ok = 4;
        REQUIRE(ok.has_value());
        CHECK(*ok == 4);

        Expected<int> failed = std::unexpected(Error{Error::Code::IoConflict, "busy"});
        REQUIRE_FALSE(failed.has_value());
        CHECK(failed.error().code == Error::Code::IoConflict);
        CHECK(failed.error().message == "busy");
    }
}
