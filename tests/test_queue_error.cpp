#include <gtest/gtest.h>
#include "core/queue_error.hpp"
#include <string>

TEST(QueueError, CategoryAndMessages) {
    boost::system::error_code ec = queue_errc::closed;
    EXPECT_EQ(ec.value(), 1);
    EXPECT_STREQ(ec.category().name(), "boundq");
    EXPECT_EQ(ec.message(), "put on a closed queue");

    ec = queue_errc::invalid_capacity;
    EXPECT_EQ(ec.message(), "queue capacity must be positive");
    EXPECT_EQ(ec, make_error_code(queue_errc::invalid_capacity));
    EXPECT_NE(ec, make_error_code(queue_errc::closed));
}

TEST(QueueError, QueueClosedCarriesCode) {
    try {
        throw QueueClosed();
    } catch (const boost::system::system_error& e) {
        EXPECT_EQ(e.code(), make_error_code(queue_errc::closed));
    }
}

TEST(QueueError, ValidateCapacity) {
    EXPECT_EQ(validate_capacity(1), 1u);
    EXPECT_EQ(validate_capacity(4096), 4096u);
    try {
        validate_capacity(-7);
        FAIL() << "expected InvalidCapacity";
    } catch (const InvalidCapacity& e) {
        EXPECT_EQ(e.requested(), -7);
        EXPECT_EQ(e.code(), make_error_code(queue_errc::invalid_capacity));
        EXPECT_NE(std::string(e.what()).find("capacity=-7"), std::string::npos);
    }
    EXPECT_THROW(validate_capacity(0), InvalidCapacity);
}
