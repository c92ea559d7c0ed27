#pragma once
#include <source_location>
#include <string_view>

namespace test {
class Test {
  public:
	Test();
	Test(Test const&) = default;
	Test(Test&&) = default;
	Test& operator=(Test const&) = default;
	Test& operator=(Test&&) = default;

	virtual ~Test() = default;

	virtual std::string_view get_name() const = 0;
	virtual void run() const = 0;

  protected:
	static void do_expect(bool pred, std::string_view expr, std::source_location const& location);
	static void do_assert(bool pred, std::string_view expr, std::source_location const& location);
};
} // namespace test

#define EXPECT(pred) do_expect(pred, #pred, std::source_location::current()) // NOLINT(cppcoreguidelines-macro-usage)
#define ASSERT(pred) do_assert(pred, #pred, std::source_location::current()) // NOLINT(cppcoreguidelines-macro-usage)

// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define EXPECT_THROW(expr, Type)                                                                                                                               \
	do {                                                                                                                                                       \
		auto threw_ = false;                                                                                                                                   \
		try {                                                                                                                                                  \
			static_cast<void>(expr);                                                                                                                           \
		} catch (Type const&) { threw_ = true; }                                                                                                               \
		do_expect(threw_, #expr " throws " #Type, std::source_location::current());                                                                            \
	} while (false)

// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define ADD_TEST(Class)                                                                                                                                        \
	struct Test_##Class : ::test::Test {                                                                                                                       \
		void run() const final;                                                                                                                                \
		std::string_view get_name() const final { return #Class; }                                                                                             \
	};                                                                                                                                                         \
	inline Test_##Class const g_test_##Class{};                                                                                                                \
	inline void Test_##Class::run() const
