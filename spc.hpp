/**
 * spc payload - version 1.00
 * --------------------------------------------------------
 * Swiss Payment Code (QR-bill) payload generator and validator
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include "spc_model.hpp"
#include "spc_text.hpp"
#include "spc_checksum.hpp"
#include "spc_classify.hpp"
#include "spc_validate.hpp"
#include "spc_document.hpp"
#include "spc_format.hpp"
