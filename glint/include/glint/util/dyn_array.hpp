#pragma once
#include <algorithm>
#include <cassert>
#include <cstddef>
#include <memory>
#include <span>

namespace glint {
///
/// \brief Basic dynamic array (wrapper over std::unique_ptr<T[]> + size).
///
/// Storage is value-initialized on construction (zeroed for trivial types).
///
template <typename T>
class DynArray {
  public:
	DynArray() = default;

	///
	/// \brief Construct a dynamic array of given size.
	/// \param size Desired size of dynamic array
	///
	explicit DynArray(std::size_t size) : m_data(std::make_unique<T[]>(size)), m_size(size) {}

	///
	/// \brief Construct a dynamic array and populate it with the given data.
	/// \param data Data to copy
	///
	explicit DynArray(std::span<T const> data) : DynArray(data.size()) { std::copy(data.begin(), data.end(), m_data.get()); }

	T* data() const { return m_data.get(); }
	std::size_t size() const { return m_data ? m_size : 0u; }
	std::span<T> span() const { return {m_data.get(), size()}; }

	///
	/// \brief Set every element to value.
	///
	void fill(T const& value) const { std::fill_n(m_data.get(), size(), value); }

	T& operator[](std::size_t index) const {
		assert(index < size());
		return m_data[index];
	}

	bool empty() const { return size() == 0u; }
	explicit operator bool() const { return m_data != nullptr; }

  private:
	std::unique_ptr<T[]> m_data{};
	std::size_t m_size{};
};

using ByteArray = DynArray<std::byte>;
} // namespace glint
