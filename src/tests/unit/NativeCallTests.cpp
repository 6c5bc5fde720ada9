//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/NativeCallTests.cpp
// Purpose: Call kernels through the word-based invoker and the dynamic loader.
// Key invariants: Return values come back in the declared element type.
// Ownership/Lifetime: The kernel library is linked and reopened by path.
// Links: docs/codemap.md#invoke
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "binder/ArgumentBinder.hpp"
#include "invoke/NativeCall.hpp"
#include "invoke/NativeLibrary.hpp"
#include "tests/common/FunctionFixtures.hpp"

#include <cstdint>
#include <cstdlib>
#include <utility>
#include <vector>

using namespace hat;
using namespace hat::test;
using binder::ArgumentBinder;
using binder::ScalarValue;
using binder::SuppliedInputs;
using support::ErrorKind;

TEST(NativeCallTest, ClassifiesReturns)
{
    auto fn = function("f", {});
    EXPECT_EQ(invoke::returnClassOf(fn), invoke::ReturnClass::Void);
    fn.returnValue = returns(ElementType::Float32);
    EXPECT_EQ(invoke::returnClassOf(fn), invoke::ReturnClass::Float32);
    fn.returnValue = returns(ElementType::Float64);
    EXPECT_EQ(invoke::returnClassOf(fn), invoke::ReturnClass::Float64);
    fn.returnValue = returns(ElementType::UInt8);
    EXPECT_EQ(invoke::returnClassOf(fn), invoke::ReturnClass::Integer);
}

TEST(NativeCallTest, NarrowIntegerReturnsKeepTheirSign)
{
    auto fn = function("add_i32",
                       {element("a", ElementType::Int32), element("b", ElementType::Int32)});
    fn.returnValue = returns(ElementType::Int32);
    auto binder = ArgumentBinder::create(fn);
    ASSERT_TRUE(binder);

    SuppliedInputs inputs;
    inputs.setScalar("a", ScalarValue::fromInteger(ElementType::Int32, -7));
    inputs.setScalar("b", ScalarValue::fromInteger(ElementType::Int32, 3));
    auto args = binder.value().bind(inputs);
    ASSERT_TRUE(args);
    ASSERT_TRUE(invoke::call(native(&add_i32), args.value()));
    ASSERT_TRUE(args.value().returnValue().has_value());
    EXPECT_EQ(args.value().returnValue()->toInteger(), -4);
}

TEST(NativeCallTest, FloatingReturns)
{
    auto mean = function("mean_f32",
                         {element("n", ElementType::Int64), runtime("data", ElementType::Float32, "n")});
    mean.returnValue = returns(ElementType::Float32);
    auto meanBinder = ArgumentBinder::create(mean);
    ASSERT_TRUE(meanBinder);
    SuppliedInputs meanInputs;
    meanInputs.setScalar("n", ScalarValue::fromInteger(ElementType::Int64, 4));
    meanInputs.setArray<float>("data", {1.0f, 2.0f, 3.0f, 6.0f});
    auto meanArgs = meanBinder.value().bind(meanInputs);
    ASSERT_TRUE(meanArgs);
    ASSERT_TRUE(invoke::call(native(&mean_f32), meanArgs.value()));
    EXPECT_FLOAT_EQ(static_cast<float>(meanArgs.value().returnValue()->toReal()), 3.0f);

    auto dot = function("dot_f64",
                        {element("n", ElementType::Int64),
                         runtime("a", ElementType::Float64, "n"),
                         runtime("b", ElementType::Float64, "n")});
    dot.returnValue = returns(ElementType::Float64);
    auto dotBinder = ArgumentBinder::create(dot);
    ASSERT_TRUE(dotBinder);
    SuppliedInputs dotInputs;
    dotInputs.setScalar("n", ScalarValue::fromInteger(ElementType::Int64, 3));
    dotInputs.setArray<double>("a", {1.0, 2.0, 3.0});
    dotInputs.setArray<double>("b", {4.0, -5.0, 0.5});
    auto dotArgs = dotBinder.value().bind(dotInputs);
    ASSERT_TRUE(dotArgs);
    ASSERT_TRUE(invoke::call(native(&dot_f64), dotArgs.value()));
    EXPECT_DOUBLE_EQ(dotArgs.value().returnValue()->toReal(), -4.5);
}

TEST(NativeCallTest, SixtyFourBitIntegerReturn)
{
    auto fn = function("sum_i64",
                       {element("n", ElementType::Int64), runtime("data", ElementType::Int64, "n")});
    fn.returnValue = returns(ElementType::Int64);
    auto binder = ArgumentBinder::create(fn);
    ASSERT_TRUE(binder);
    SuppliedInputs inputs;
    inputs.setScalar("n", ScalarValue::fromInteger(ElementType::Int64, 3));
    inputs.setArray<std::int64_t>("data", {5000000000LL, -1, 2});
    auto args = binder.value().bind(inputs);
    ASSERT_TRUE(args);
    ASSERT_TRUE(invoke::call(native(&sum_i64), args.value()));
    EXPECT_EQ(args.value().returnValue()->toInteger(), 5000000001LL);
}

TEST(NativeCallTest, NullSymbolIsReported)
{
    const auto fn = sleepSpec();
    auto binder = ArgumentBinder::create(fn);
    ASSERT_TRUE(binder);
    SuppliedInputs inputs;
    auto args = binder.value().bind(inputs);
    ASSERT_TRUE(args);
    auto ok = invoke::call(invoke::NativeFunction{}, args.value());
    ASSERT_FALSE(ok);
    EXPECT_EQ(ok.error().kind, ErrorKind::SymbolNotFound);
}

TEST(NativeLibraryTest, OpensKernelLibraryAndResolvesSymbols)
{
    auto lib = invoke::NativeLibrary::open(HAT_TEST_KERNELS_PATH);
    ASSERT_TRUE(lib);

    auto fn = rangeSpec("output_dim", "RangePaired");
    fn.outputRelease = "release_buffer";
    auto resolved = lib.value().resolve(fn);
    ASSERT_TRUE(resolved);
    ASSERT_NE(resolved.value().symbol, nullptr);
    ASSERT_NE(resolved.value().release, nullptr);

    // The loader hands back the same library the test is linked against.
    released_reset();
    resolved.value().release(std::malloc(16));
    EXPECT_EQ(released_count(), 1u);
    released_reset();

    auto withFree = rangeSpec();
    withFree.outputRelease = "free";
    auto plain = lib.value().resolve(withFree);
    ASSERT_TRUE(plain);
    EXPECT_EQ(plain.value().release, nullptr);
}

TEST(NativeLibraryTest, ReportsMissingLibraryAndSymbols)
{
    auto missing = invoke::NativeLibrary::open("/nonexistent/libnothing.so");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().kind, ErrorKind::LibraryLoadFailed);

    auto lib = invoke::NativeLibrary::open(HAT_TEST_KERNELS_PATH);
    ASSERT_TRUE(lib);
    auto symbol = lib.value().symbol("no_such_kernel");
    ASSERT_FALSE(symbol);
    EXPECT_EQ(symbol.error().kind, ErrorKind::SymbolNotFound);

    auto fn = rangeSpec("output_dim", "RangePaired");
    fn.outputRelease = "no_such_release";
    auto resolved = lib.value().resolve(fn);
    ASSERT_FALSE(resolved);
    EXPECT_EQ(resolved.error().kind, ErrorKind::SymbolNotFound);
}

TEST(NativeLibraryTest, MovedLibraryKeepsHandle)
{
    auto lib = invoke::NativeLibrary::open(HAT_TEST_KERNELS_PATH);
    ASSERT_TRUE(lib);
    invoke::NativeLibrary moved = std::move(lib.value());
    EXPECT_EQ(moved.path(), HAT_TEST_KERNELS_PATH);
    EXPECT_TRUE(moved.symbol("sleep_1ms"));
}
