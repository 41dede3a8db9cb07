#ifndef bta_assert_throw_hpp
#define bta_assert_throw_hpp
//   Copyright 2017 Carlos O'Ryan
//
//   Licensed under the Apache License, Version 2.0 (the "License");
//   you may not use this file except in compliance with the License.
//   You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
//   Unless required by applicable law or agreed to in writing, software
//   distributed under the License is distributed on an "AS IS" BASIS,
//   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//   See the License for the specific language governing permissions and
//   limitations under the License.
/**
 * @file
 *
 * Define a macro to check preconditions at runtime.
 */

#ifndef BTA_ASSERT_THROW
/**
 * Check the predicate @a P and if false raise an exception describing the problem.
 *
 * Unlike assert() the check is never compiled out: the conditions guarded with this macro (starting a call twice,
 * registering the same completion queue tag twice) are programming errors that would otherwise corrupt the state of
 * an asynchronous operation.
 */
#define BTA_ASSERT_THROW(P)                                                                                            \
  do {                                                                                                                 \
    if (not(P)) {                                                                                                      \
      bta::assert_throw_impl(#P, __func__, __FILE__, __LINE__);                                                        \
    }                                                                                                                  \
  } while (false)
#endif // BTA_ASSERT_THROW

namespace bta {

/**
 * Implement the @c BTA_ASSERT_THROW macro out-of-line.
 *
 * @param what the text description of the predicate
 * @param function the location (function) where the predicate was asserted.
 * @param filename the location (source code filename) where the predicate was asserted.
 * @param lineno the location (line number) where the predicate was asserted.
 * @throws std::logic_error always.
 */
[[noreturn]] void assert_throw_impl(char const* what, char const* function, char const* filename, int lineno);
} // namespace bta

#endif // bta_assert_throw_hpp
