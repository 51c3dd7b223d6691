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

#ifndef BPDFCONSTANTS_H
#define BPDFCONSTANTS_H

/*
 * REMEMBER:
 *
 * Keep this file 'C' compatible. New values must be added to the end of each enumeration so
 * that no constant's numerical value changes. Batch status reports and exit codes are consumed
 * by front ends that store the numbers.
 */

/* Exit Codes from the bpdf CLI */

enum bpdf_exit_code_e {
    bpdf_exit_success = 0,
    bpdf_exit_error = 2,
    bpdf_exit_warning = 3,
};

/* Error Codes */

enum bpdf_error_code_e {
    bpdf_e_success = 0,
    bpdf_e_internal,            /* logic/programming error -- indicates bug */
    bpdf_e_system,              /* I/O error reading or writing a file */
    bpdf_e_unsupported,         /* image or stream encoding that can't be handled */
    bpdf_e_password,            /* incorrect password for encrypted file */
    bpdf_e_damaged_pdf,         /* syntax errors or other damage in PDF */
    bpdf_e_pages,               /* erroneous or unsupported pages structure */
    bpdf_e_object,              /* type/bounds errors accessing objects */
    bpdf_e_broken_reference,    /* indirect reference to an object that doesn't exist */
    bpdf_e_empty_input,         /* operation given no input documents */
    bpdf_e_invalid_range,       /* page range out of bounds or overlapping */
    bpdf_e_invalid_permutation, /* page order that isn't a bijection */
    bpdf_e_invalid_angle,       /* rotation that isn't a multiple of 90 */
    bpdf_e_invalid_parameter,   /* any other bad operation parameter */
    bpdf_e_ocr_unavailable,     /* no recognizer configured */
    bpdf_e_unrecoverable,       /* repair could not recover any page */
    bpdf_e_signature,           /* signing failed */
};

/* Object Types. The numeric values match the alternatives of the object value variant. */

enum bpdf_object_type_e {
    /* Object types internal to bpdf */
    ot_uninitialized,
    ot_reserved,
    /* Object types that can occur in the main document */
    ot_null,
    ot_boolean,
    ot_integer,
    ot_real,
    ot_string,
    ot_name,
    ot_array,
    ot_dictionary,
    ot_stream,
    /* Additional object types that can occur in content streams */
    ot_operator,
    ot_inlineimage,
    /* Indirect reference, resolved through the owning document */
    ot_reference,
};

/* Stream data decoding. These must be in order from less to more decoding. */

enum bpdf_stream_decode_level_e {
    bpdf_dl_none = 0,    /* preserve all stream filters */
    bpdf_dl_generalized, /* decode general-purpose filters */
    bpdf_dl_all          /* also decode lossy filters (DCT) */
};

/* Operations known to the engine */

enum bpdf_operation_e {
    bpdf_op_merge = 0,
    bpdf_op_split,
    bpdf_op_rotate,
    bpdf_op_reorder,
    bpdf_op_compress,
    bpdf_op_encrypt,
    bpdf_op_decrypt,
    bpdf_op_sign,
    bpdf_op_verify,
    bpdf_op_watermark,
    bpdf_op_add_text,
    bpdf_op_add_image,
    bpdf_op_paginate,
    bpdf_op_extract_text,
    bpdf_op_extract_images,
    bpdf_op_metadata,
    bpdf_op_repair,
    bpdf_op_ocr,
    bpdf_op_info,
};

/* Status of a batch job */

enum bpdf_job_status_e {
    bpdf_js_pending = 0,
    bpdf_js_running,
    bpdf_js_succeeded,
    bpdf_js_failed,
    bpdf_js_skipped,
};

/* Standard security handler permission bits (ISO 32000-1, table 22), 1-based bit numbers */

enum bpdf_permission_e {
    bpdf_perm_print = 1 << 2,
    bpdf_perm_modify = 1 << 3,
    bpdf_perm_copy = 1 << 4,
    bpdf_perm_annotate = 1 << 5,
    bpdf_perm_fill_forms = 1 << 8,
    bpdf_perm_accessibility = 1 << 9,
    bpdf_perm_assemble = 1 << 10,
    bpdf_perm_print_high = 1 << 11,
};

#endif /* BPDFCONSTANTS_H */
