#include "raybind/error.hpp"
#include <cstdint>
#include <gtest/gtest.h>

using namespace raybind;

// ============================================================================
// StatusCode
// ============================================================================

TEST(StatusCode, OkIsNotFatal) {
  StatusCode ok;
  EXPECT_TRUE(ok.ok());
  EXPECT_FALSE(ok.is_fatal());
  EXPECT_EQ(ok.engine_code(), 0);
}

TEST(StatusCode, RecoverableCarriesCode) {
  auto s = StatusCode::recoverable(RAY_EC_PARSE);
  EXPECT_FALSE(s.ok());
  EXPECT_FALSE(s.is_fatal());
  EXPECT_EQ(s.engine_code(), RAY_EC_PARSE);
  EXPECT_EQ(s.raw(), -9);
}

TEST(StatusCode, WellFormedOnlyWithinCodeAndFatalBits) {
  EXPECT_TRUE(StatusCode().well_formed());
  EXPECT_TRUE(StatusCode::recoverable(RAY_EC_HANDLE).well_formed());
  EXPECT_TRUE(StatusCode::fatal(RAY_EC_INTERNAL).well_formed());
  EXPECT_FALSE(StatusCode(1).well_formed());
  EXPECT_FALSE(StatusCode(-0x200).well_formed());
  EXPECT_FALSE(StatusCode(INT32_MIN).well_formed());
}

TEST(StatusCode, FatalFlagIsSeparateFromCode) {
  auto s = StatusCode::fatal(RAY_EC_INTERNAL);
  EXPECT_TRUE(s.is_fatal());
  EXPECT_EQ(s.engine_code(), RAY_EC_INTERNAL);
  EXPECT_EQ(s.raw(), -(0x100 | 13));
}

// ============================================================================
// Translation table
// ============================================================================

TEST(Translate, EveryEngineCodeHasACategory) {
  struct Case {
    ray_errc_t code;
    ErrorKind kind;
  };
  const Case cases[] = {
      {RAY_EC_TYPE, ErrorKind::InvalidArgument},
      {RAY_EC_ARITY, ErrorKind::InvalidArgument},
      {RAY_EC_LENGTH, ErrorKind::InvalidArgument},
      {RAY_EC_DOMAIN, ErrorKind::InvalidArgument},
      {RAY_EC_INDEX, ErrorKind::InvalidArgument},
      {RAY_EC_VALUE, ErrorKind::NotFound},
      {RAY_EC_LIMIT, ErrorKind::ResourceExhausted},
      {RAY_EC_OS, ErrorKind::EngineInternal},
      {RAY_EC_PARSE, ErrorKind::InvalidArgument},
      {RAY_EC_NYI, ErrorKind::Unsupported},
      {RAY_EC_USER, ErrorKind::InvalidArgument},
      {RAY_EC_CANCELLED, ErrorKind::Cancelled},
      {RAY_EC_INTERNAL, ErrorKind::EngineInternal},
      {RAY_EC_NOMEM, ErrorKind::ResourceExhausted},
      {RAY_EC_HANDLE, ErrorKind::InvalidArgument},
  };
  for (const auto &c : cases) {
    EXPECT_EQ(translate_kind(StatusCode::recoverable(c.code)), c.kind)
        << "code " << c.code;
    // The fatal flag never changes the category.
    EXPECT_EQ(translate_kind(StatusCode::fatal(c.code)), c.kind)
        << "fatal code " << c.code;
  }
}

TEST(Translate, UnknownCodesAreBindingInternal) {
  EXPECT_EQ(translate_kind(StatusCode(RAY_STATUS(200))),
            ErrorKind::BindingInternal);
  EXPECT_EQ(translate_kind(StatusCode(-0x100)), ErrorKind::BindingInternal);
  EXPECT_EQ(translate_kind(StatusCode(7)), ErrorKind::BindingInternal);
  // A valid low byte with bits above the fatal flag is still out of contract.
  EXPECT_EQ(translate_kind(StatusCode(-(0x200 | RAY_EC_TYPE))),
            ErrorKind::BindingInternal);
  EXPECT_EQ(translate_kind(StatusCode(-(0x10000 | 0x100 | RAY_EC_OS))),
            ErrorKind::BindingInternal);
}

TEST(Translate, HighBitsAreReportedRaw) {
  BindError err =
      translate(StatusCode(-(0x200 | RAY_EC_TYPE)), "ray_execute", "bad");
  EXPECT_EQ(err.kind, ErrorKind::BindingInternal);
  EXPECT_EQ(err.message, "ray_execute: unrecognized engine status -513");
}

TEST(Translate, MessageCarriesContextAndEngineText) {
  BindError err = translate(StatusCode::recoverable(RAY_EC_PARSE),
                            "ray_prepare", "unexpected token ')'");
  EXPECT_EQ(err.kind, ErrorKind::InvalidArgument);
  EXPECT_EQ(err.severity, Severity::Recoverable);
  EXPECT_EQ(err.status, RAY_STATUS(RAY_EC_PARSE));
  EXPECT_EQ(err.message, "ray_prepare failed (parse): unexpected token ')'");
}

TEST(Translate, MessageWithoutEngineText) {
  BindError err = translate(StatusCode::fatal(RAY_EC_OS), "ray_open");
  EXPECT_TRUE(err.fatal());
  EXPECT_EQ(err.kind, ErrorKind::EngineInternal);
  EXPECT_EQ(err.message, "ray_open failed (os)");
}

TEST(Translate, UnknownStatusIsReportedRaw) {
  BindError err = translate(StatusCode(RAY_STATUS(77)), "ray_fetch", "ignored");
  EXPECT_EQ(err.kind, ErrorKind::BindingInternal);
  EXPECT_NE(err.message.find("unrecognized engine status -77"),
            std::string::npos);
}

TEST(Translate, EngineCodeNames) {
  EXPECT_EQ(engine_code_name(RAY_EC_TYPE), "type");
  EXPECT_EQ(engine_code_name(RAY_EC_HANDLE), "handle");
  EXPECT_EQ(engine_code_name(0), "unknown");
  EXPECT_EQ(engine_code_name(99), "unknown");
}

// ============================================================================
// Exceptions
// ============================================================================

TEST(Error, DescribeIncludesStatusOnlyForEngineErrors) {
  EXPECT_EQ(make_error(ErrorKind::NotFound, "no such table").describe(),
            "NotFound: no such table");

  BindError engine = translate(StatusCode::fatal(RAY_EC_INTERNAL), "ray_fetch");
  EXPECT_EQ(engine.describe(),
            "EngineInternal [fatal]: ray_fetch failed (internal) (status -269)");
}

TEST(Error, ThrowCarriesDetail) {
  try {
    throw_error(make_error(ErrorKind::Unsupported, "nested arrays"));
    FAIL() << "throw_error returned";
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::Unsupported);
    EXPECT_FALSE(e.fatal());
    EXPECT_EQ(e.status(), RAY_OK);
    EXPECT_STREQ(e.what(), "Unsupported: nested arrays");
  }
}

TEST(Error, UnwrapPassesValuesThrough) {
  Result<int> ok = 42;
  EXPECT_EQ(unwrap(std::move(ok)), 42);

  Result<int> bad = fail(ErrorKind::Cancelled, "stop");
  EXPECT_THROW(unwrap(std::move(bad)), Error);

  Result<void> fine;
  EXPECT_NO_THROW(unwrap(std::move(fine)));
}
