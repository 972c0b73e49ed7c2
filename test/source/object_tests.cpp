#include <stdexcept>
#include <string>

#include <fmt/format.h>
#include <gtest/gtest.h>
#include <object/object.hpp>

// NOLINTBEGIN(*-magic-numbers)
TEST(object, testTypeTags)
{
    const integer_object int_obj {42};
    const error_object err_obj {"broken"};
    const return_value_object ret_obj {&int_obj};

    EXPECT_EQ(int_obj.type(), object::object_type::integer);
    EXPECT_EQ(tru()->type(), object::object_type::boolean);
    EXPECT_EQ(fals()->type(), object::object_type::boolean);
    EXPECT_EQ(null()->type(), object::object_type::null);
    EXPECT_EQ(ret_obj.type(), object::object_type::return_value);
    EXPECT_EQ(err_obj.type(), object::object_type::error);

    EXPECT_TRUE(err_obj.is_error());
    EXPECT_TRUE(ret_obj.is_return_value());
    EXPECT_TRUE(null()->is_null());
    EXPECT_FALSE(fals()->is_null());
}

TEST(object, testTypeTagNames)
{
    using enum object::object_type;
    EXPECT_EQ(fmt::format("{}", integer), "INTEGER");
    EXPECT_EQ(fmt::format("{}", boolean), "BOOLEAN");
    EXPECT_EQ(fmt::format("{}", null), "NULL");
    EXPECT_EQ(fmt::format("{}", return_value), "RETURN_VALUE");
    EXPECT_EQ(fmt::format("{}", error), "ERROR");
    EXPECT_THROW((void)fmt::format("{}", static_cast<object::object_type>(200)), std::invalid_argument);
}

TEST(object, testSingletons)
{
    EXPECT_EQ(tru(), tru());
    EXPECT_EQ(fals(), fals());
    EXPECT_EQ(null(), null());
    EXPECT_NE(tru(), fals());
    EXPECT_EQ(native_bool_to_object(true), tru());
    EXPECT_EQ(native_bool_to_object(false), fals());
    EXPECT_TRUE(tru()->val<boolean_object>());
    EXPECT_FALSE(fals()->val<boolean_object>());
}

TEST(object, testInspect)
{
    const integer_object int_obj {-42};
    const return_value_object ret_obj {&int_obj};

    EXPECT_EQ(int_obj.inspect(), "-42");
    EXPECT_EQ(tru()->inspect(), "true");
    EXPECT_EQ(fals()->inspect(), "false");
    EXPECT_EQ(null()->inspect(), "null");
    EXPECT_EQ(ret_obj.inspect(), "-42");
    EXPECT_EQ(error_object {"identifier not found: x"}.inspect(), "ERROR: identifier not found: x");
    EXPECT_EQ(return_value_object {nullptr}.inspect(), "");
}

TEST(object, testMakeError)
{
    const auto* err = make_error("unknown operator: {}{}", "-", object::object_type::boolean);
    ASSERT_TRUE(err->is_error());
    EXPECT_EQ(err->val<error_object>(), "unknown operator: -BOOLEAN");
}
// NOLINTEND(*-magic-numbers)
