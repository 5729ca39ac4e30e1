#include <doctest/doctest.h>

#include "modules/ErrorClassifier.hpp"

using namespace vitco;

TEST_CASE("Check-in codes are inferred from server wording") {
    CHECK(classifier::inferCheckInCode("Check-in is too early for your shift") == "TOO_EARLY");
    CHECK(classifier::inferCheckInCode("Too late to check in") == "TOO_LATE");
    CHECK(classifier::inferCheckInCode("No shift assigned for today") == "NO_SHIFT_ASSIGNED");
    CHECK(classifier::inferCheckInCode("Shift inactive") == "SHIFT_INACTIVE");
    CHECK(classifier::inferCheckInCode("Holiday work is not permitted") == "HOLIDAY_NOT_ALLOWED");
    CHECK(classifier::inferCheckInCode("User already checked in") == "ALREADY_CHECKED_IN");
    CHECK(classifier::inferCheckInCode("WiFi network is not approved") == "NETWORK_NOT_APPROVED");
    CHECK(classifier::inferCheckInCode("Device fingerprint missing") == "DEVICE_FINGERPRINT_REQUIRED");
    CHECK(classifier::inferCheckInCode("Something odd happened").empty());
}

TEST_CASE("Check-out codes are inferred from server wording") {
    CHECK(classifier::inferCheckOutCode("User is not checked in") == "NOT_CHECKED_IN");
    CHECK(classifier::inferCheckOutCode("Already checked out today") == "ALREADY_CHECKED_OUT");
    CHECK(classifier::inferCheckOutCode("Cannot perform check-out in current attendance status") == "INVALID_STATUS");
    CHECK(classifier::inferCheckOutCode("Network not allowed") == "NETWORK_NOT_APPROVED");
    CHECK(classifier::inferCheckOutCode("").empty());
}

TEST_CASE("Error types follow the code before the message") {
    CHECK(classifier::checkInErrorType("NETWORK_NOT_APPROVED", "whatever") == ErrorType::Network);
    CHECK(classifier::checkInErrorType("", "Invalid token") == ErrorType::Authentication);
    CHECK(classifier::checkInErrorType("TOO_EARLY", "") == ErrorType::Validation);
    CHECK(classifier::checkInErrorType("HOLIDAY_NOT_ALLOWED", "") == ErrorType::Validation);
    CHECK(classifier::checkInErrorType("", "") == ErrorType::System);
    CHECK(classifier::checkInErrorType("", "Database exploded") == ErrorType::System);

    CHECK(classifier::checkOutErrorType("NOT_CHECKED_IN", "") == ErrorType::Validation);
    CHECK(classifier::checkOutErrorType("INVALID_STATUS", "") == ErrorType::Validation);
    CHECK(classifier::checkOutErrorType("", "ethernet adapter unknown") == ErrorType::Network);
    CHECK(classifier::checkOutErrorType("", "Internal server error") == ErrorType::System);
}

TEST_CASE("User messages come from the code table with a fallback") {
    CHECK(classifier::checkInMessage("TOO_EARLY", "raw") == "It is too early to check in. Please check in during your assigned shift time window.");
    CHECK(classifier::checkInMessage("SOMETHING_NEW", "raw text") == "raw text");
    CHECK(classifier::checkOutMessage("NOT_CHECKED_IN", "raw") == "You are not checked in. Cannot check out.");
    CHECK(classifier::checkOutMessage("", "raw text") == "raw text");
}

TEST_CASE("Classification prefers the server code") {
    SUBCASE("server code") {
        const auto error{classifier::classifyCheckIn(Status::HttpError(400, "Holiday today", "TOO_LATE"))};
        CHECK(error.errorCode == "TOO_LATE");
        CHECK(error.type == ErrorType::Validation);
        CHECK(error.userMessage == "It is too late to check in. Please contact your manager if you need to mark attendance.");
    }

    SUBCASE("inferred code") {
        const auto error{classifier::classifyCheckIn(Status::HttpError(400, "Holiday today"))};
        CHECK(error.errorCode == "HOLIDAY_NOT_ALLOWED");
        CHECK(error.type == ErrorType::Validation);
    }

    SUBCASE("unauthorized wins over the wording") {
        const auto error{classifier::classifyCheckIn(Status::HttpError(401, "Network session expired"))};
        CHECK(error.type == ErrorType::Authentication);
    }

    SUBCASE("empty message") {
        const auto error{classifier::classifyCheckOut(Status::HttpError(500, ""))};
        CHECK(error.errorCode.empty());
        CHECK(error.type == ErrorType::System);
        CHECK(error.userMessage == "Unknown error during check-out");
    }
}

TEST_CASE("Connection failures are transport errors only") {
    CHECK(classifier::isConnectionFailure(Status::Error(ErrorCode::NetworkError, "connect: Connection refused")));
    CHECK(classifier::isConnectionFailure(Status::Error(ErrorCode::Timeout, "timed out")));
    CHECK_FALSE(classifier::isConnectionFailure(Status::HttpError(503, "Service unavailable")));
    CHECK_FALSE(classifier::isConnectionFailure(Status::OK()));
}

TEST_CASE("Status conflicts mean the server already closed the record") {
    CHECK(classifier::isStatusConflict("ALREADY_CHECKED_OUT", ""));
    CHECK(classifier::isStatusConflict("INVALID_STATUS", ""));
    CHECK(classifier::isStatusConflict("", "You are already checked out"));
    CHECK(classifier::isStatusConflict("", "Cannot check out in current attendance status"));
    CHECK_FALSE(classifier::isStatusConflict("NETWORK_NOT_APPROVED", "Network not approved"));
}
