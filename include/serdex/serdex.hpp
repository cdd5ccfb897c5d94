#pragma once

/// @file serdex.hpp
/// @author Aleksandr Loshkarev
/// @brief Main header file for the serdex library.

#include "config.hpp"
#include "error.hpp"
#include "name_map.hpp"
#include "outliner.hpp"
#include "deserializer.hpp"
#include "serializer.hpp"
#include "text_reader.hpp"
#include "text_writer.hpp"
#include "value.hpp"
#include "conversion.hpp"
#include "define.hpp"
#include "json/outliner.hpp"
#include "json/text_deserializer.hpp"
#include "json/text_serializer.hpp"
#include "json/helper.hpp"
#include "json/json.hpp"
