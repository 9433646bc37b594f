#pragma once

#define ESP32IRPAIRCODEC_VERSION_MAJOR 1
#define ESP32IRPAIRCODEC_VERSION_MINOR 0
#define ESP32IRPAIRCODEC_VERSION_PATCH 0
#define ESP32IRPAIRCODEC_VERSION_STR "1.0.0"
