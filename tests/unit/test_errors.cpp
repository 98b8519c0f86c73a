#include <gtest/gtest.h>
#include "core/errors/bridge_errors.hpp"

using namespace cuebridge::core::errors;

// A dummy lookup that fails the way the resolver does
Result<std::string> simulate_resolve(bool should_fail) {
    if (should_fail) {
        return BridgeError{ErrorCategory::Resolution, "cue not found", kExecutableNotFound};
    }
    return std::string("/usr/local/bin/cue");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_resolve(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "/usr/local/bin/cue");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_resolve(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Resolution);
    EXPECT_EQ(error.message, "cue not found");
    EXPECT_TRUE(error.cause.empty());
}

TEST(ErrorModelTest, DefaultsCodeWhenOmitted) {
    BridgeError error{ErrorCategory::Internal, "boom"};
    EXPECT_EQ(error.code, "unknown_error");
    EXPECT_FALSE(is_tool_unavailable(error));
}

TEST(ErrorModelTest, ClassifiesToolUnavailableCodes) {
    EXPECT_TRUE(is_tool_unavailable(BridgeError{ErrorCategory::Resolution, "", kExecutableNotFound}));
    EXPECT_TRUE(is_tool_unavailable(BridgeError{ErrorCategory::Resolution, "", kUserPathNotFound}));
    EXPECT_TRUE(is_tool_unavailable(BridgeError{ErrorCategory::Execution, "", kExecuteError}));
    EXPECT_EQ(to_string(ErrorCategory::Execution), "execution");
}
