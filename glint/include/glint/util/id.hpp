#pragma once
#include <concepts>
#include <cstdint>

namespace glint {
///
/// \brief Represents a strongly-typed integral ID.
///
template <typename Type, std::equality_comparable Value = std::uint64_t>
class Id {
  public:
	using id_type = Value;

	constexpr Id(Value value = {}) : m_value(static_cast<Value&&>(value)) {}

	constexpr Value const& value() const { return m_value; }
	constexpr operator Value const&() const { return value(); }

	bool operator==(Id const&) const = default;

  private:
	Value m_value{};
};
} // namespace glint
