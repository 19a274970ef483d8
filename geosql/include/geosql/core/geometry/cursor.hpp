#pragma once
#include "geosql/common.hpp"
#include "geosql/core/exception.hpp"

namespace geosql {

namespace core {

// Bounds checked reader over an untrusted buffer
class Cursor {
private:
	const_data_ptr_t start;
	const_data_ptr_t ptr;
	const_data_ptr_t end;

public:
	explicit Cursor(const_data_ptr_t start, const_data_ptr_t end) : start(start), ptr(start), end(end) {
	}

	idx_t Position() const {
		return static_cast<idx_t>(ptr - start);
	}

	idx_t Remaining() const {
		D_ASSERT(ptr <= end);
		return static_cast<idx_t>(end - ptr);
	}

	template <class T>
	T Read() {
		static_assert(std::is_trivially_copyable<T>::value, "T must be trivially copyable");
		if (Remaining() < sizeof(T)) {
			throw MalformedWKBException("unexpected end of buffer at offset %llu, needed %llu more bytes",
			                            Position(), sizeof(T) - Remaining());
		}
		auto result = Load<T>(ptr);
		ptr += sizeof(T);
		return result;
	}

	template <class T>
	T ReadBigEndian() {
		static_assert(std::is_floating_point<T>::value || std::is_integral<T>::value,
		              "T must be a floating point or integral type");
		if (Remaining() < sizeof(T)) {
			throw MalformedWKBException("unexpected end of buffer at offset %llu, needed %llu more bytes",
			                            Position(), sizeof(T) - Remaining());
		}

		uint8_t in[sizeof(T)];
		uint8_t out[sizeof(T)];
		memcpy(in, ptr, sizeof(T));
		ptr += sizeof(T);

		for (size_t i = 0; i < sizeof(T); i++) {
			out[i] = in[sizeof(T) - i - 1];
		}
		T swapped = 0;
		memcpy(&swapped, out, sizeof(T));
		return swapped;
	}
};

// Writer over a buffer sized up front
class WriteCursor {
private:
	data_ptr_t ptr;
	data_ptr_t end;

public:
	explicit WriteCursor(data_ptr_t start, data_ptr_t end) : ptr(start), end(end) {
	}

	template <class T>
	void Write(T value) {
		static_assert(std::is_trivially_copyable<T>::value, "T must be trivially copyable");
		if (ptr + sizeof(T) > end) {
			throw InternalException("Trying to write past end of buffer");
		}
		Store<T>(value, ptr);
		ptr += sizeof(T);
	}

	template <class T>
	void WriteBigEndian(T value) {
		static_assert(std::is_floating_point<T>::value || std::is_integral<T>::value,
		              "T must be a floating point or integral type");
		if (ptr + sizeof(T) > end) {
			throw InternalException("Trying to write past end of buffer");
		}
		uint8_t in[sizeof(T)];
		memcpy(in, &value, sizeof(T));
		for (size_t i = 0; i < sizeof(T); i++) {
			ptr[i] = in[sizeof(T) - i - 1];
		}
		ptr += sizeof(T);
	}

	bool IsAtEnd() const {
		return ptr == end;
	}
};

} // namespace core

} // namespace geosql
