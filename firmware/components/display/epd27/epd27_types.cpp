/**
 * @file epd27_types.cpp
 * @brief Name lookups for error codes and states.
 */

#include "epd27_types.h"


const char* epd27ErrToName(Epd27Err err) {
    switch (err) {
        case EPD27_OK:                      return "EPD27_OK";
        case EPD27_ERR_NOT_INITIALIZED:     return "EPD27_ERR_NOT_INITIALIZED";
        case EPD27_ERR_ASLEEP:              return "EPD27_ERR_ASLEEP";
        case EPD27_ERR_TIMEOUT:             return "EPD27_ERR_TIMEOUT";
        case EPD27_ERR_UNSUPPORTED_FORMAT:  return "EPD27_ERR_UNSUPPORTED_FORMAT";
        case EPD27_ERR_BUS:                 return "EPD27_ERR_BUS";
        case EPD27_ERR_NO_MEM:              return "EPD27_ERR_NO_MEM";
    }
    return "EPD27_ERR_UNKNOWN";
}


const char* epd27StateToName(Epd27State state) {
    switch (state) {
        case EPD27_STATE_UNINITIALIZED: return "UNINITIALIZED";
        case EPD27_STATE_AWAKE:         return "AWAKE";
        case EPD27_STATE_BUSY:          return "BUSY";
        case EPD27_STATE_ASLEEP:        return "ASLEEP";
    }
    return "UNKNOWN";
}
