//
// Created by usatiynyan.
//

#include "sl/mono/model.hpp"
#include "sl/mono/processor.hpp"
#include "sl/mono/subscriber.hpp"

#include "support.hpp"

#include <gtest/gtest.h>

#include <exception>
#include <string>
#include <system_error>
#include <type_traits>
#include <vector>

namespace sl::mono {

TEST(modelError, category) {
    const std::error_code ec = make_error_code(errc::invalid_demand);
    EXPECT_EQ(&ec.category(), &mono_category());
    EXPECT_STREQ(mono_category().name(), "sl::mono");
    EXPECT_EQ(ec.message(), "request amount must be positive");

    // errc converts implicitly
    const std::error_code implicit = errc::timed_out;
    EXPECT_EQ(implicit, make_error_code(errc::timed_out));
}

TEST(modelError, conditions) {
    EXPECT_EQ(make_error_code(errc::invalid_demand), std::errc::invalid_argument);
    EXPECT_EQ(make_error_code(errc::timed_out), std::errc::timed_out);
    EXPECT_EQ(make_error_code(errc::duplicate_subscription), std::errc::operation_not_permitted);
    EXPECT_NE(make_error_code(errc::timed_out), std::errc::invalid_argument);
}

TEST(modelError, protocolErrorForErrorCode) {
    static_assert(ProtocolError<std::error_code>);
    EXPECT_EQ(make_protocol_error<std::error_code>(errc::timed_out), make_error_code(errc::timed_out));
}

TEST(modelError, protocolErrorForExceptionPtr) {
    static_assert(ProtocolError<std::exception_ptr>);

    const std::exception_ptr error = make_protocol_error<std::exception_ptr>(errc::duplicate_subscription);
    ASSERT_TRUE(error);
    try {
        std::rethrow_exception(error);
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code(), make_error_code(errc::duplicate_subscription));
        return;
    }
    FAIL() << "expected std::system_error";
}

TEST(modelDropSink, defaultIsShared) {
    auto& sink = default_drop_sink<int, std::error_code>();
    EXPECT_EQ(&sink, (&default_drop_sink<int, std::error_code>()));
    sink.on_next_dropped(1);
    sink.on_error_dropped(make_error_code(errc::timed_out));
}

TEST(functorSubscriber, requestsInitialDemand) {
    std::vector<int> values;
    std::vector<std::error_code> errors;
    int completes = 0;

    auto subscriber = as_subscriber<int, std::error_code>(
        [&values](int&& value) { values.push_back(value); },
        [&errors](std::error_code&& error) { errors.push_back(error); },
        [&completes] { ++completes; }
    );

    test::manual_source<int> source;
    source.subscribe(subscriber);
    EXPECT_EQ(subscriber.get_subscription(), &source);
    EXPECT_EQ(source.request_count.load(), 1);
    EXPECT_EQ(source.last_request.load(), 1);

    source.emit_next(3);
    source.emit_complete();
    EXPECT_EQ(values, std::vector<int>{ 3 });
    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(completes, 1);
}

TEST(functorSubscriber, zeroInitialRequestLeavesDemandToOwner) {
    std::vector<std::error_code> errors;
    auto subscriber = as_subscriber<int, std::error_code>(
        [](int&&) {}, [&errors](std::error_code&& error) { errors.push_back(error); }, [] {}, 0
    );

    test::manual_source<int> source;
    source.subscribe(subscriber);
    EXPECT_EQ(source.request_count.load(), 0);

    subscriber.get_subscription()->request(5);
    EXPECT_EQ(source.request_count.load(), 1);
    EXPECT_EQ(source.last_request.load(), 5);

    source.emit_error(make_error_code(errc::timed_out));
    EXPECT_EQ(errors, std::vector<std::error_code>{ make_error_code(errc::timed_out) });
}

TEST(functorSubscriber, consumesCell) {
    std::string received;
    bool completed = false;
    auto subscriber = as_subscriber<std::string, std::error_code>(
        [&received](std::string&& value) { received = std::move(value); },
        [](std::error_code&&) { FAIL(); },
        [&completed] { completed = true; }
    );

    mono_processor<std::string> cell;
    cell | subscriber;
    cell.on_next("hello");
    EXPECT_EQ(received, "hello");
    EXPECT_TRUE(completed);
}

TEST(modelSyntax, pipeChainsStages) {
    test::manual_source<int> source;
    mono_processor<int> cell;
    test::recording_subscriber<int> first;
    test::recording_subscriber<int> second;

    publisher<int, std::error_code>& chained = source | cell;
    EXPECT_EQ(&chained, (static_cast<publisher<int, std::error_code>*>(&cell)));
    chained | first;
    cell | second;

    source.emit_complete();
    EXPECT_EQ(first.complete_count(), 1);
    EXPECT_EQ(second.complete_count(), 1);
    EXPECT_EQ(source.request_count.load(), 1);
}

TEST(modelConcept, publisherConcept) {
    static_assert(Publisher<mono_processor<int>>);
    static_assert(Publisher<test::manual_source<int>>);
    static_assert(SubscriberOf<mono_processor<int>, int, std::error_code>);
    static_assert(SubscriberOf<functor_subscriber<int, std::error_code>, int, std::error_code>);
    static_assert(!SubscriberOf<test::manual_source<int>, int, std::error_code>);
    static_assert(std::is_same_v<ISubscriberFor<mono_processor<int>>, subscriber<int, std::error_code>>);

    dummy_subscriber<int, std::error_code> dummy;
    mono_processor<int> cell;
    cell.on_next(1);
    cell.subscribe(dummy);
    EXPECT_TRUE(cell.is_success());
}

} // namespace sl::mono
