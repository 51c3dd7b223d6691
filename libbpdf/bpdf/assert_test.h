/*
 * Include this file to use assert in test programs. This ensures that NDEBUG is undefined, which
 * would otherwise turn every check into a spurious pass.
 */

#ifndef BPDF_ASSERT_TEST_H
#define BPDF_ASSERT_TEST_H

#ifdef NDEBUG
# undef NDEBUG
#endif
#include <assert.h>

#endif /* BPDF_ASSERT_TEST_H */
