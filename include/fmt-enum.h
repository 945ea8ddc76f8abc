#ifndef JIDKIT_FMT_ENUM_H
#define JIDKIT_FMT_ENUM_H

#include <spdlog/logger.h>
#include "stringprep.h"


#define JIDKIT_ENUM_ENTRY_TXT(x, y) case x: name = y; break;
#define JIDKIT_ENUM_FORMATTER(e, c) \
template <> \
struct fmt::formatter< e > : fmt::formatter<std::string_view> { \
    auto format(const e val, fmt::format_context& ctx) const { \
        std::string_view name = "[Unknown " #e " value]"; \
        switch (val) { \
            using enum e ; \
            c \
        }                          \
        return fmt::formatter<std::string_view>::format(name, ctx);   \
        }                          \
}

JIDKIT_ENUM_FORMATTER(Jidkit::PrepKind,
                      JIDKIT_ENUM_ENTRY_TXT(NODEPREP, "nodeprep")
                      JIDKIT_ENUM_ENTRY_TXT(NAMEPREP, "nameprep")
                      JIDKIT_ENUM_ENTRY_TXT(RESOURCEPREP, "resourceprep")
);


#endif //JIDKIT_FMT_ENUM_H
