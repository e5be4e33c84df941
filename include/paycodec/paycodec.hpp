#pragma once

// Umbrella header for the paycodec library

#include "paycodec/bits.hpp"
#include "paycodec/config.hpp"
#include "paycodec/field_registry.hpp"
#include "paycodec/hex.hpp"
#include "paycodec/iso8583.hpp"
#include "paycodec/iso8583_format.hpp"
#include "paycodec/tag_registry.hpp"
#include "paycodec/tlv.hpp"
#include "paycodec/tlv_compare.hpp"
#include "paycodec/tlv_edit.hpp"
#include "paycodec/tlv_format.hpp"
#include "paycodec/types.hpp"
