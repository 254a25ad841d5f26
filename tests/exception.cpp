#include <cassert>
#include <cimap/exception/exception.hpp>
#include <cstring>
#include <sstream>
#include <string>
#include <typeinfo>

using namespace cimap;

void test_runtime_error()
{
    runtime_error err("Runtime error occurred");
    assert(std::string(err.what()) == "Runtime error occurred");
    assert(err.except_info.addresses_count == 0); // Check PROCESS_UNITTEST

    runtime_error copy(err);
    assert(copy.what() == err.what());
}

void test_bad_alloc()
{
    bad_alloc alloc_ex(512);
    assert(strstr(alloc_ex.what(), "512") != nullptr);
}

void test_key_not_found()
{
    key_not_found named("'hello'");
    assert(std::string(named.what()) == "key not found: 'hello'");
    assert(std::string(named.key()) == "'hello'");

    key_not_found anonymous("");
    assert(std::string(anonymous.what()) == "key not found");
    assert(std::string(anonymous.key()).empty());

    try
    {
        throw key_not_found("42");
    }
    catch (const exception &e)
    {
        assert(strstr(e.what(), "42") != nullptr);
    }
}

void test_invalid_backing_store()
{
    invalid_backing_store err("vector_store");
    assert(strstr(err.what(), "vector_store") != nullptr);
    assert(strstr(err.what(), "not a mutable mapping") != nullptr);
}

void test_stacktrace()
{
    runtime_error err("Runtime error occurred");
    capture_stack_trace(err.except_info);
    assert(err.except_info.addresses_count > 0);

    std::stringstream stream;
    write_stack_trace(stream, err.except_info);
    assert(stream.str().find("Stack trace:") == 0);
    assert(stream.str().find("#0") != std::string::npos);

#ifndef _MSC_VER
    assert(demangle(typeid(runtime_error).name()) == "cimap::runtime_error");
#endif
}

void test_exception()
{
    test_runtime_error();
    test_bad_alloc();
    test_key_not_found();
    test_invalid_backing_store();
    test_stacktrace();
}
