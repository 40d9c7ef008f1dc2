#ifndef INCLUDE_GRADEBOX_LOGGER_H_
#define INCLUDE_GRADEBOX_LOGGER_H_

// Keep spdlog's console sinks consistent across fork(); call once at startup
void InitLogger();

#endif  // INCLUDE_GRADEBOX_LOGGER_H_
