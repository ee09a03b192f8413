/**
 * @file exact_string.cpp
 * @brief ExactString compilation unit.
 *
 * BasicExactString is a template and lives in the header. The default
 * HeapAllocator instantiation is compiled once here; the header declares
 * it extern so users of ExactString do not instantiate it again.
 *
 * @see include/exactstr/exact_string.hpp for the full implementation
 */

#include <exactstr/exact_string.hpp>

namespace exactstr {

template class BasicExactString<HeapAllocator>;

} // namespace exactstr
