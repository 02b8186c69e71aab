// tests/test_framework.hpp
#pragma once
#include <chrono>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace tfw {

struct TestCase {
    std::string name;
    std::function<void()> fn;
};

inline std::vector<TestCase>& registry() {
    static std::vector<TestCase> r;
    return r;
}

struct Registrar {
    Registrar(const std::string& name, std::function<void()> fn) {
        registry().push_back({name, std::move(fn)});
    }
};

#define CONCAT_INNER(a,b) a##b
#define CONCAT(a,b) CONCAT_INNER(a,b)

#define TEST(name) \
    static void CONCAT(test_fn_,__LINE__)(); \
    static ::tfw::Registrar CONCAT(test_reg_,__LINE__)(name, CONCAT(test_fn_,__LINE__)); \
    static void CONCAT(test_fn_,__LINE__)()

struct Failure : public std::exception {
    std::string msg;
    explicit Failure(std::string m) : msg(std::move(m)) {}
    const char* what() const noexcept override { return msg.c_str(); }
};

inline std::string loc(const char* file, int line) {
    std::ostringstream oss;
    oss << file << ":" << line;
    return oss.str();
}

// Shapes and coordinates print as [a, b, c] in failure output.
template <class T>
inline void print_value(std::ostream& os, const T& v) { os << v; }

template <class T>
inline void print_value(std::ostream& os, const std::vector<T>& v) {
    os << '[';
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (i) os << ", ";
        print_value(os, v[i]);
    }
    os << ']';
}

inline void assert_true(bool cond, const char* expr, const char* file, int line) {
    if (!cond) {
        std::ostringstream oss;
        oss << "[ASSERT_TRUE FAILED] " << expr << " at " << loc(file, line);
        throw Failure(oss.str());
    }
}
#define ASSERT_TRUE(x) ::tfw::assert_true((x), #x, __FILE__, __LINE__)
#define ASSERT_FALSE(x) ::tfw::assert_true(!(x), "!(" #x ")", __FILE__, __LINE__)

template <class A, class B>
inline void assert_eq(const A& a, const B& b, const char* ea, const char* eb, const char* file, int line) {
    if (!(a == b)) {
        std::ostringstream oss;
        oss << "[ASSERT_EQ FAILED] " << ea << " == " << eb << " at " << loc(file, line) << "\n  " << ea << " = ";
        print_value(oss, a);
        oss << "\n  " << eb << " = ";
        print_value(oss, b);
        throw Failure(oss.str());
    }
}
#define ASSERT_EQ(a,b) ::tfw::assert_eq((a), (b), #a, #b, __FILE__, __LINE__)

// Runs `stmt`; fails unless it throws exactly something catchable as `Exc`.
#define ASSERT_THROWS(stmt, Exc) \
    do { \
        bool tfw_threw_ = false; \
        try { stmt; } catch (const Exc&) { tfw_threw_ = true; } \
        if (!tfw_threw_) { \
            std::ostringstream tfw_oss_; \
            tfw_oss_ << "[ASSERT_THROWS FAILED] " #stmt " did not throw " #Exc " at " \
                     << ::tfw::loc(__FILE__, __LINE__); \
            throw ::tfw::Failure(tfw_oss_.str()); \
        } \
    } while (0)

} // namespace tfw
