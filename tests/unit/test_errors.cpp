#include <gtest/gtest.h>
#include "core/errors/server_errors.hpp"

using namespace rustmcp::core::errors;

// A dummy function to simulate a handler failing
Result<std::string> simulate_analysis(bool should_fail) {
    if (should_fail) {
        return ServerError{ErrorCategory::Execution, "Analyzer crashed", "analyzer_crashed"};
    }
    return std::string("analysis complete");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_analysis(false);

    // Check that it is NOT an error
    EXPECT_FALSE(is_error(result));
    // Check that the value is correct
    EXPECT_EQ(get_value(result), "analysis complete");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_analysis(true);

    // Check that it IS an error
    EXPECT_TRUE(is_error(result));

    // Check the error details
    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Execution);
    EXPECT_EQ(error.message, "Analyzer crashed");
    EXPECT_EQ(error.code, "analyzer_crashed");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, StatusCarriesNoValue) {
    Status done = ok();
    EXPECT_FALSE(is_error(done));

    Status failed = ServerError{ErrorCategory::Transport, "Transport is closed"};
    ASSERT_TRUE(is_error(failed));
    EXPECT_EQ(get_error(failed).code, "unknown_error");
}

TEST(ErrorModelTest, CategoryNamesAreStable) {
    EXPECT_EQ(to_string(ErrorCategory::Input), "input");
    EXPECT_EQ(to_string(ErrorCategory::Protocol), "protocol");
    EXPECT_EQ(to_string(ErrorCategory::Transport), "transport");
    EXPECT_EQ(to_string(ErrorCategory::Execution), "execution");
    EXPECT_EQ(to_string(ErrorCategory::Internal), "internal");
}
