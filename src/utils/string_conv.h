#ifndef STRING_CONV_H
#define STRING_CONV_H

#include <sstream>
#include <string>
#include <type_traits>

// Parse the whole string as T. Returns false (and leaves result untouched) on garbage.
template<class T>
bool TryString2Value(const std::string &s, T &result)
{
	std::stringstream ss(s);
	T value;
	ss >> value;
	if (ss.fail())
		return false;
	ss >> std::ws;
	if (!ss.eof())
		return false;
	result = value;
	return true;
}

// "1234567" -> "1,234,567"; sign and fractional part are preserved
inline std::string insert_thousands_commas(const std::string &numeric)
{
	size_t start = (!numeric.empty() && numeric[0] == '-') ? 1 : 0;
	size_t int_end = numeric.find('.');
	if (int_end == std::string::npos) int_end = numeric.size();

	std::string out = numeric.substr(0, start);
	for (size_t i = start; i < int_end; ++i) {
		if (i > start && (int_end - i) % 3 == 0)
			out.push_back(',');
		out.push_back(numeric[i]);
	}
	out += numeric.substr(int_end);
	return out;
}

template <typename T>
inline typename std::enable_if<std::is_integral<T>::value, std::string>::type
format_with_commas(T value)
{
	return insert_thousands_commas(std::to_string(value));
}

#endif
