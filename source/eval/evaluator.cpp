#include <cstdint>
#include <limits>
#include <type_traits>

#include "evaluator.hpp"

#include <arena.hpp>
#include <ast/if_expression.hpp>
#include <ast/literals.hpp>
#include <ast/operators.hpp>
#include <ast/statements.hpp>
#include <lexer/token_type.hpp>
#include <object/object.hpp>

#include "environment.hpp"

namespace
{
using value_type = integer_object::value_type;
using unsigned_value_type = std::make_unsigned_t<value_type>;

// signed overflow wraps around in two's complement instead of being undefined
auto wrapping_add(value_type lhs, value_type rhs) -> value_type
{
    return static_cast<value_type>(static_cast<unsigned_value_type>(lhs) + static_cast<unsigned_value_type>(rhs));
}

auto wrapping_sub(value_type lhs, value_type rhs) -> value_type
{
    return static_cast<value_type>(static_cast<unsigned_value_type>(lhs) - static_cast<unsigned_value_type>(rhs));
}

auto wrapping_mul(value_type lhs, value_type rhs) -> value_type
{
    return static_cast<value_type>(static_cast<unsigned_value_type>(lhs) * static_cast<unsigned_value_type>(rhs));
}

auto wrapping_neg(value_type val) -> value_type
{
    return static_cast<value_type>(unsigned_value_type {0} - static_cast<unsigned_value_type>(val));
}

auto integer_division(value_type lhs, value_type rhs) -> const object*
{
    if (rhs == 0) {
        return make_error("division by zero");
    }
    if (lhs == std::numeric_limits<value_type>::min() && rhs == -1) {
        return make<integer_object>(lhs);
    }
    return make<integer_object>(lhs / rhs);
}

auto is_error(const object* obj) -> bool
{
    return obj != nullptr && obj->is_error();
}

// no value is truthy, only the canonical NULL and FALSE are not
auto is_truthy(const object* obj) -> bool
{
    return obj != null() && obj != fals();
}

// Operators that dispatch on the operand type see a missing value as NULL.
auto or_null(const object* obj) -> const object*
{
    return obj != nullptr ? obj : null();
}

auto apply_integer_operator(token_type oper, value_type lhs, value_type rhs) -> const object*
{
    using enum token_type;
    switch (oper) {
        case plus:
            return make<integer_object>(wrapping_add(lhs, rhs));
        case minus:
            return make<integer_object>(wrapping_sub(lhs, rhs));
        case asterisk:
            return make<integer_object>(wrapping_mul(lhs, rhs));
        case slash:
            return integer_division(lhs, rhs);
        case equals:
            return native_bool_to_object(lhs == rhs);
        case not_equals:
            return native_bool_to_object(lhs != rhs);
        case less_than:
            return native_bool_to_object(lhs < rhs);
        case greater_than:
            return native_bool_to_object(lhs > rhs);
        default:
            return nullptr;
    }
}

auto apply_binary_operator(token_type oper, const object* left, const object* right) -> const object*
{
    if (left->type() != right->type()) {
        // the message names '+' whatever the operator was
        return make_error("type mismatch: {} + {}", left->type(), right->type());
    }
    if (left->is(object::object_type::integer)) {
        if (const auto* result = apply_integer_operator(oper, left->val<integer_object>(), right->val<integer_object>());
            result != nullptr)
        {
            return result;
        }
    } else if (oper == token_type::equals) {
        return native_bool_to_object(left == right);
    } else if (oper == token_type::not_equals) {
        return native_bool_to_object(left != right);
    }
    return make_error("unknown operator: {} {} {}", left->type(), oper, right->type());
}

auto apply_bang_operator(const object* operand) -> const object*
{
    if (operand == fals() || operand == null()) {
        return tru();
    }
    return fals();
}

auto apply_minus_operator(const object* operand) -> const object*
{
    if (!operand->is(object::object_type::integer)) {
        return make_error("unknown operator: -{}", operand->type());
    }
    return make<integer_object>(wrapping_neg(operand->val<integer_object>()));
}
}  // namespace

evaluator::evaluator(environment* env)
    : m_env {env != nullptr ? env : make<environment>()}
{
}

auto evaluator::evaluate(const expression* node) -> const object*
{
    m_result = nullptr;
    if (node != nullptr) {
        node->accept(*this);
    }
    return m_result;
}

// Stops at the first error or return value and hands it back still wrapped.
auto evaluator::eval_sequence(const statement_list& stmts) -> const object*
{
    const object* last = nullptr;
    for (const auto* stmt : stmts) {
        last = evaluate(stmt);
        if (last != nullptr && (last->is_error() || last->is_return_value())) {
            break;
        }
    }
    return last;
}

void evaluator::visit(const program& node)
{
    const auto* result = eval_sequence(node.statements);
    if (result != nullptr && result->is_return_value()) {
        result = result->as<return_value_object>()->return_value;
    }
    m_result = result;
}

void evaluator::visit(const block_statement& node)
{
    m_result = eval_sequence(node.statements);
}

void evaluator::visit(const expression_statement& node)
{
    m_result = evaluate(node.expr);
}

void evaluator::visit(const let_statement& node)
{
    const auto* value = evaluate(node.value);
    if (is_error(value)) {
        m_result = value;
        return;
    }
    m_env->set(node.name->value, value);
    m_result = nullptr;
}

void evaluator::visit(const return_statement& node)
{
    const auto* value = evaluate(node.value);
    m_result = is_error(value) ? value : make<return_value_object>(value);
}

void evaluator::visit(const identifier& node)
{
    const auto bound = m_env->get(node.value);
    m_result = bound.has_value() ? *bound : make_error("identifier not found: {}", node.value);
}

void evaluator::visit(const integer_literal& node)
{
    m_result = make<integer_object>(node.value);
}

void evaluator::visit(const boolean_literal& node)
{
    m_result = native_bool_to_object(node.value);
}

void evaluator::visit(const unary_expression& node)
{
    const auto* operand = evaluate(node.right);
    if (is_error(operand)) {
        m_result = operand;
        return;
    }
    switch (node.op) {
        case token_type::bang:
            m_result = apply_bang_operator(operand);
            break;
        case token_type::minus:
            m_result = apply_minus_operator(or_null(operand));
            break;
        default:
            m_result = make_error("unknown operator: {}{}", node.op, or_null(operand)->type());
            break;
    }
}

void evaluator::visit(const binary_expression& node)
{
    const auto* left = evaluate(node.left);
    if (is_error(left)) {
        m_result = left;
        return;
    }
    const auto* right = evaluate(node.right);
    if (is_error(right)) {
        m_result = right;
        return;
    }
    m_result = apply_binary_operator(node.op, or_null(left), or_null(right));
}

void evaluator::visit(const if_expression& node)
{
    const auto* condition = evaluate(node.condition);
    if (is_error(condition)) {
        m_result = condition;
        return;
    }
    if (is_truthy(condition)) {
        m_result = evaluate(node.consequence);
    } else if (node.alternative != nullptr) {
        m_result = evaluate(node.alternative);
    } else {
        m_result = null();
    }
}
