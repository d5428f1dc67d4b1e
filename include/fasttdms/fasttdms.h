// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef AIFO_FASTTDMS_INCLUDE_FASTTDMS_FASTTDMS_H_
#define AIFO_FASTTDMS_INCLUDE_FASTTDMS_FASTTDMS_H_

/**
 * @file fasttdms.h
 * @brief Main header for the FastTDMS library
 *
 * FastTDMS gives random access to the channels of TDMS measurement files
 * without re-scanning the file and without reading unrequested bytes.
 *
 * ## Architecture
 *
 * - **Core**: Pure domain models (types, paths, locations, plans)
 * - **Format**: Segment header decoding into SegmentDescriptors
 * - **Index / Planner / Executor**: build once, plan per query (no I/O),
 *   execute plans against a byte source
 * - **Runtime**: Byte sources and element decoding
 *
 * @see fasttdms/tdms_file.h for the entry point
 */

// ============================================================================
// Core Domain Models
// ============================================================================

#include "fasttdms/core/data_location.h"
#include "fasttdms/core/data_type.h"
#include "fasttdms/core/errors.h"
#include "fasttdms/core/object_path.h"
#include "fasttdms/core/property.h"
#include "fasttdms/core/read_plan.h"
#include "fasttdms/core/segment_descriptor.h"
#include "fasttdms/core/value.h"

// ============================================================================
// Components
// ============================================================================

#include "fasttdms/executor/read_executor.h"
#include "fasttdms/format/segment_header_decoder.h"
#include "fasttdms/index/index.h"
#include "fasttdms/planner/read_planner.h"
#include "fasttdms/runtime/io/element_decoder.h"
#include "fasttdms/runtime/io/random_access_source.h"

// ============================================================================
// Public API
// ============================================================================

#include "fasttdms/options.h"
#include "fasttdms/tdms_file.h"

#endif  // AIFO_FASTTDMS_INCLUDE_FASTTDMS_FASTTDMS_H_
