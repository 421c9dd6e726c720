#include <doctest/doctest.h>

#include <blueprint/state/Expressions.hpp>
#include <blueprint/state/StateStore.hpp>

#include <cstdint>
#include <limits>

using namespace BP;

namespace {

auto make_store() -> StateStore {
    Value::Object state;
    state.emplace("count", Value{2});
    state.emplace("ratio", Value{1.5});
    state.emplace("name", Value{"Ada"});
    state.emplace("flag", Value{true});
    state.emplace("numeric", Value{"41"});
    state.emplace("items", Value{Value::Array{Value{"x"}, Value{"y"}}});
    state.emplace("empty", Value{Value::Array{}});
    return StateStore(std::move(state));
}

} // namespace

TEST_SUITE("state.expressions") {

TEST_CASE("pure expressions keep the value type") {
    auto store = make_store();
    CHECK(Expressions::Evaluate("${count}", store) == Value{2});
    CHECK(Expressions::Evaluate("  ${ flag } ", store) == Value{true});
    CHECK(Expressions::Evaluate("${items}", store).asArray()->size() == 2);
    CHECK(Expressions::Evaluate("${missing}", store).isNull());
}

TEST_CASE("one-step arithmetic") {
    auto store = make_store();
    CHECK(Expressions::Evaluate("${count} + 1", store) == Value{3});
    CHECK(Expressions::Evaluate("${count} - 5", store) == Value{-3});
    CHECK(Expressions::Evaluate("${ratio} + 1", store) == Value{2.5});
    CHECK(Expressions::Evaluate("${numeric} + 1", store) == Value{42});
    CHECK(Expressions::Evaluate("${missing} + 4", store) == Value{4});
    CHECK(Expressions::Evaluate("${name} + 1", store).isNull());
}

TEST_CASE("decrementing zero goes negative") {
    StateStore store(Value::Object{{"count", Value{0}}});
    CHECK(Expressions::Evaluate("${count} - 1", store) == Value{-1});
}

TEST_CASE("integer overflow yields null") {
    StateStore store;
    store.set("big", Value{std::numeric_limits<std::int64_t>::max()});
    store.set("small", Value{std::numeric_limits<std::int64_t>::min()});
    CHECK(Expressions::Evaluate("${big} + 1", store).isNull());
    CHECK(Expressions::Evaluate("${small} - 1", store).isNull());
    CHECK(Expressions::Evaluate("${missing} - -9223372036854775808", store).isNull());
    CHECK(Expressions::Evaluate("${big} - 1", store) == Value{std::numeric_limits<std::int64_t>::max() - 1});
    CHECK(Expressions::Evaluate("${small} + 0", store) == Value{std::numeric_limits<std::int64_t>::min()});
}

TEST_CASE("ternaries choose a literal") {
    auto store = make_store();
    CHECK(Expressions::Evaluate("${flag ? 'On' : 'Off'}", store) == Value{"On"});
    CHECK(Expressions::Evaluate("${!flag ? 'On' : \"Off\"}", store) == Value{"Off"});
    CHECK(Expressions::Evaluate("${empty.isEmpty ? 'none' : 'some'}", store) == Value{"none"});
    CHECK(Expressions::Evaluate("${items.contains('y') ? 'yes' : 'no'}", store) == Value{"yes"});
}

TEST_CASE("array accessors") {
    auto store = make_store();
    CHECK(Expressions::Evaluate("${items.count}", store) == Value{2});
    CHECK(Expressions::Evaluate("${items.first}", store) == Value{"x"});
    CHECK(Expressions::Evaluate("${items.last}", store) == Value{"y"});
    CHECK(Expressions::Evaluate("${empty.first}", store).isNull());
    CHECK(Expressions::Evaluate("${items.contains('q')}", store) == Value{false});
    CHECK(Expressions::Evaluate("${name.contains('d')}", store) == Value{true});
}

TEST_CASE("mixed text interpolates") {
    auto store = make_store();
    CHECK(Expressions::Evaluate("Hello ${name}, you have ${count}", store) == Value{"Hello Ada, you have 2"});
    CHECK(Expressions::Interpolate("Count: ${count}", store) == "Count: 2");
    CHECK(Expressions::Interpolate("${missing}!", store) == "!");
    CHECK(Expressions::Interpolate("no spans", store) == "no spans");
    CHECK(Expressions::Interpolate("unterminated ${count", store) == "unterminated ${count");
}

TEST_CASE("truthiness and conditions") {
    CHECK_FALSE(Expressions::IsTruthy(Value{}));
    CHECK_FALSE(Expressions::IsTruthy(Value{0}));
    CHECK_FALSE(Expressions::IsTruthy(Value{""}));
    CHECK_FALSE(Expressions::IsTruthy(Value{Value::Array{}}));
    CHECK(Expressions::IsTruthy(Value{"0"}));
    CHECK(Expressions::IsTruthy(Value{0.1}));

    auto store = make_store();
    CHECK(Expressions::EvaluateCondition("flag", store));
    CHECK(Expressions::EvaluateCondition("${flag}", store));
    CHECK_FALSE(Expressions::EvaluateCondition("!flag", store));
    CHECK(Expressions::EvaluateCondition("empty.isEmpty", store));
    CHECK_FALSE(Expressions::EvaluateCondition("missing", store));
    CHECK(Expressions::EvaluateCondition("true", store));
}

TEST_CASE("expression detection") {
    CHECK(Expressions::ContainsExpression("a ${b} c"));
    CHECK_FALSE(Expressions::ContainsExpression("a b c"));
    CHECK(Expressions::IsPureExpression(" ${a.b} "));
    CHECK_FALSE(Expressions::IsPureExpression("${a} ${b}"));
    CHECK_FALSE(Expressions::IsPureExpression("${a} + 1"));
    CHECK(Expressions::UnwrapExpression("${ user.name }") == "user.name");
    CHECK_FALSE(Expressions::UnwrapExpression("user.name").has_value());
}

} // TEST_SUITE
