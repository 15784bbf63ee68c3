template<typename T>
constexpr auto read(uint8_t const*& ptr) -> T
{
	T value{};
	std::memcpy(&value, ptr, sizeof(T));
	ptr += sizeof(T);
	return value;
}

template<typename T>
constexpr auto read(uint8_t*& ptr) -> T
{
	return read<T>(const_cast<uint8_t const*&>(ptr));
}

template<typename T>
auto read_at(std::vector<uint8_t> const& buffer, size_t pos) -> T
{
	T value{};
	std::memcpy(&value, buffer.data() + pos, sizeof(T));
	return value;
}

template<typename T>
auto write_at(std::vector<uint8_t>& buffer, size_t pos, T value) -> void
{
	std::memcpy(buffer.data() + pos, &value, sizeof(T));
}

template<typename T>
auto append(std::vector<uint8_t>& buffer, T value) -> void
{
	auto const pos = buffer.size();
	buffer.resize(pos + sizeof(T));
	std::memcpy(buffer.data() + pos, &value, sizeof(T));
}
