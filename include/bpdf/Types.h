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

#ifndef BPDFTYPES_H
#define BPDFTYPES_H

/* Provide an offset type that is as big as possible so that large files can be handled. */

typedef long long int bpdf_offset_t;

#endif /* BPDFTYPES_H */
