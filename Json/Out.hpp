#ifndef JSON_OUT_HPP
#define JSON_OUT_HPP

#include"Json/Detail/Str.hpp"
#include<cstddef>
#include<cstdint>
#include<memory>
#include<sstream>
#include<string>

namespace Json { class Out; }

namespace Json { namespace Detail {

/* Pre-declare these.  */
typedef std::stringstream Content;
template<typename Up> class Array;
template<typename Up> class Object;

/* Simple type serialization.  */
template<typename t>
struct Serializer;
template<>
struct Serializer<double> {
	static std::string serialize(double v) {
		return Str::from_double(v);
	}
};
template<>
struct Serializer<int> {
	static std::string serialize(int v) {
		return std::to_string(v);
	}
};
template<>
struct Serializer<std::int64_t> {
	static std::string serialize(std::int64_t v) {
		return std::to_string(v);
	}
};
template<>
struct Serializer<std::uint64_t> {
	static std::string serialize(std::uint64_t v) {
		return std::to_string(v);
	}
};
template<>
struct Serializer<bool> {
	static std::string serialize(bool v) {
		return v ? "true" : "false";
	}
};
template<>
struct Serializer<std::string> {
	static std::string serialize(std::string const& v) {
		return "\"" + Str::to_escaped(v) + "\"";
	}
};
template<std::size_t n>
struct Serializer<char [n]> {
	static std::string serialize(char const v[n]) {
		return "\"" + Str::to_escaped(v) + "\"";
	}
};
template<>
struct Serializer<std::nullptr_t> {
	static std::string serialize(std::nullptr_t) {
		return "null";
	}
};

template<typename Up>
class Object {
private:
	Up& up;
	Content& content;
	bool started;

	void encomma() {
		if (started)
			content << ", ";
		else
			started = true;
	}
	void key(std::string const& name) {
		encomma();
		content << Serializer<std::string>::serialize(name)
			<< ": "
			;
	}

public:
	Object(Up& up_, Content& content_) : up(up_)
					   , content(content_)
					   , started(false) {
		content << '{';
	}

	template<typename a>
	Object<Up>& field(std::string const& name, a const& value) {
		key(name);
		content << Serializer<a>::serialize(value);
		return *this;
	}

	/* Declared later when all types are completed.  */
	Array<Object<Up>> start_array(std::string const& name);
	Object<Object<Up>> start_object(std::string const& name);

	Up& end_object() {
		content << '}';
		return up;
	}
};

template<typename Up>
class Array {
private:
	Up& up;
	Content& content;
	bool started;

	void encomma() {
		if (started)
			content << ", ";
		else
			started = true;
	}

public:
	Array(Up& up_, Content& content_) : up(up_)
					  , content(content_)
					  , started(false) {
		content << '[';
	}

	template<typename a>
	Array<Up>& entry(a const& value) {
		encomma();
		content << Serializer<a>::serialize(value);
		return *this;
	}

	/* Declared later when all types are completed.  */
	Array<Array<Up>> start_array();
	Object<Array<Up>> start_object();

	Up& end_array() {
		content << ']';
		return up;
	}
};

} /* namespace Detail */

/** class Json::Out
 *
 * @brief Builder for JSON text.
 *
 * @desc Use as:
 *
 *     auto js = Json::Out()
 *         .start_object()
 *             .field("stage", 1)
 *             .start_array("parties")
 *                 .entry(std::string("alice"))
 *             .end_array()
 *         .end_object()
 *         ;
 *     std::cout << js.output();
 *
 * Copies share the same underlying buffer.
 */
class Out {
private:
	std::shared_ptr<Json::Detail::Content> content;

public:
	Out() : content(std::make_shared<Json::Detail::Content>()) { }

	std::string output() const {
		return content->str();
	}

	Json::Detail::Object<Json::Out> start_object() {
		return Json::Detail::Object<Json::Out>(*this, *content);
	}
	Json::Detail::Array<Json::Out> start_array() {
		return Json::Detail::Array<Json::Out>(*this, *content);
	}

	static
	Json::Out empty_object() {
		return Json::Out().start_object().end_object();
	}
};

namespace Detail {

/* Embedding already-built JSON.  */
template<>
struct Serializer<Json::Out> {
	static std::string serialize(Json::Out const& v) {
		return v.output();
	}
};

/* Sub-objects and sub-arrays.  */
template<typename Up>
Array<Object<Up>> Object<Up>::start_array(std::string const& name) {
	key(name);
	return Array<Object<Up>>(*this, content);
}
template<typename Up>
Object<Object<Up>> Object<Up>::start_object(std::string const& name) {
	key(name);
	return Object<Object<Up>>(*this, content);
}
template<typename Up>
Array<Array<Up>> Array<Up>::start_array() {
	encomma();
	return Array<Array<Up>>(*this, content);
}
template<typename Up>
Object<Array<Up>> Array<Up>::start_object() {
	encomma();
	return Object<Array<Up>>(*this, content);
}

} /* namespace Detail */

} /* namespace Json */

#endif /* !defined(JSON_OUT_HPP) */
