#include "metacache/meta/interpreter.hpp"

#include <gtest/gtest.h>

#include "metacache/meta/errors.hpp"

namespace metacache::meta::test {

namespace {

MetaResponse record(Status status, const std::string& data) {
    MetaValue value;
    value.status = status;
    value.data = data;
    return MetaResponse::with_value(value);
}

}  // namespace

TEST(ResponseInterpreterTest, GetEmptySuccesses) {
    EXPECT_FALSE(ResponseInterpreter::interpret(CommandFamily::Get,
                                                MetaResponse::of(Status::NotFound)));
    EXPECT_FALSE(ResponseInterpreter::interpret(CommandFamily::Get,
                                                MetaResponse::of(Status::NoOp)));
}

TEST(ResponseInterpreterTest, SetEmptySuccesses) {
    EXPECT_FALSE(ResponseInterpreter::interpret(CommandFamily::Set,
                                                MetaResponse::of(Status::Stored)));
    EXPECT_FALSE(ResponseInterpreter::interpret(CommandFamily::Set,
                                                MetaResponse::of(Status::NoOp)));
}

TEST(ResponseInterpreterTest, DeleteEmptySuccesses) {
    EXPECT_FALSE(ResponseInterpreter::interpret(CommandFamily::Delete,
                                                MetaResponse::of(Status::Deleted)));
    EXPECT_FALSE(ResponseInterpreter::interpret(CommandFamily::Delete,
                                                MetaResponse::of(Status::NoOp)));
}

TEST(ResponseInterpreterTest, ArithmeticEmptySuccesses) {
    EXPECT_FALSE(ResponseInterpreter::interpret(CommandFamily::Arithmetic,
                                                MetaResponse::of(Status::Stored)));
    EXPECT_FALSE(ResponseInterpreter::interpret(CommandFamily::Arithmetic,
                                                MetaResponse::of(Status::NoOp)));
}

TEST(ResponseInterpreterTest, FirstRecordSurfaced) {
    MetaResponse resp = record(Status::Value, "first");
    MetaValue second;
    second.data = "second";
    resp.values.push_back(second);

    auto value = ResponseInterpreter::interpret(CommandFamily::Get, resp);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->data, "first");
}

TEST(ResponseInterpreterTest, RecordsWinForEveryFamily) {
    for (auto family : {CommandFamily::Get, CommandFamily::Set, CommandFamily::Delete,
                        CommandFamily::Arithmetic}) {
        auto value = ResponseInterpreter::interpret(family, record(Status::Value, "x"));
        ASSERT_TRUE(value.has_value());
        EXPECT_EQ(value->data, "x");
    }
}

TEST(ResponseInterpreterTest, DeleteExistsIsConflict) {
    try {
        (void)ResponseInterpreter::interpret(CommandFamily::Delete,
                                             MetaResponse::of(Status::Exists));
        FAIL() << "expected ConflictError";
    } catch (const ConflictError& e) {
        EXPECT_EQ(e.status(), Status::Exists);
    }
}

TEST(ResponseInterpreterTest, SetExistsIsGenericProtocolError) {
    try {
        (void)ResponseInterpreter::interpret(CommandFamily::Set,
                                             MetaResponse::of(Status::Exists));
        FAIL() << "expected ProtocolError";
    } catch (const ConflictError&) {
        FAIL() << "conflict is only raised for md";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.status(), Status::Exists);
    }
}

TEST(ResponseInterpreterTest, OtherStatusesAreErrors) {
    EXPECT_THROW((void)ResponseInterpreter::interpret(CommandFamily::Set,
                                                      MetaResponse::of(Status::NotStored)),
                 ProtocolError);
    EXPECT_THROW((void)ResponseInterpreter::interpret(CommandFamily::Delete,
                                                      MetaResponse::of(Status::NotFound)),
                 ProtocolError);
    EXPECT_THROW((void)ResponseInterpreter::interpret(CommandFamily::Arithmetic,
                                                      MetaResponse::of(Status::NotFound)),
                 ProtocolError);
    EXPECT_THROW((void)ResponseInterpreter::interpret(CommandFamily::Get,
                                                      MetaResponse::of(Status::Stored)),
                 ProtocolError);
}

TEST(ResponseInterpreterTest, ServerErrorKeepsMessage) {
    try {
        (void)ResponseInterpreter::interpret(
            CommandFamily::Set, MetaResponse::error(Status::ServerError, "out of memory"));
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.status(), Status::ServerError);
        EXPECT_NE(std::string(e.what()).find("out of memory"), std::string::npos);
    }
}

TEST(ErrorsTest, ToErrorCarriesStatus) {
    auto err = to_error(Status::NotStored);
    EXPECT_EQ(err.status(), Status::NotStored);
    EXPECT_EQ(std::string(err.what()), "unexpected status NOT_STORED");
}

TEST(ErrorsTest, ShouldCloseConnection) {
    EXPECT_TRUE(should_close_connection(Status::Error));
    EXPECT_TRUE(should_close_connection(Status::ClientError));
    EXPECT_FALSE(should_close_connection(Status::ServerError));
    EXPECT_FALSE(should_close_connection(Status::Exists));
}

}  // namespace metacache::meta::test
