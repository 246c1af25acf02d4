#include "Semantic.h"

const char* error_kind_name(ErrorKind kind){
    switch(kind){
        case ErrorKind::ConfigUnreadable:  return "ConfigUnreadable";
        case ErrorKind::ConfigMalformed:   return "ConfigMalformed";
        case ErrorKind::ConfigWriteFailed: return "ConfigWriteFailed";
        case ErrorKind::UnknownCommand:    return "UnknownCommand";
        case ErrorKind::MalformedMapping:  return "MalformedMapping";
        case ErrorKind::ExecutionFailed:   return "ExecutionFailed";
    }
    return "Unknown";
}
