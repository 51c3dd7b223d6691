/* Copyright (c) 2024-2026 The bpdf authors
 *
 * This file is part of bpdf.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef BPDF_DLL_HH
#define BPDF_DLL_HH

#define BPDF_MAJOR_VERSION 1
#define BPDF_MINOR_VERSION 0
#define BPDF_PATCH_VERSION 0
#define BPDF_VERSION "1.0.0"

/*
 * BPDF_DLL marks functions that belong to libbpdf's public interface. BPDF_DLL_CLASS marks
 * classes whose type information must be shared with callers, such as exceptions and classes
 * that callers derive from.
 */

#if defined(_WIN32) || defined(__CYGWIN__)
# if defined(libbpdf_EXPORTS)
#  define BPDF_DLL __declspec(dllexport)
# else
#  define BPDF_DLL
# endif
# define BPDF_DLL_CLASS
#elif defined(__GNUC__)
# define BPDF_DLL __attribute__((visibility("default")))
# define BPDF_DLL_CLASS BPDF_DLL
#else
# define BPDF_DLL
# define BPDF_DLL_CLASS
#endif

#endif /* BPDF_DLL_HH */
