#include "nestedset/version.h"

#include <string_view>

namespace nestedset {

static constexpr std::string_view VERSION_TEXT = NESTEDSET_VERSION_TEXT;

NestedSetVersion VERSION{
    .text_data = VERSION_TEXT.data(),
    .text_size = static_cast<uint32_t>(VERSION_TEXT.size()),
    .major = NESTEDSET_VERSION_MAJOR,
    .minor = NESTEDSET_VERSION_MINOR,
    .patch = NESTEDSET_VERSION_PATCH,
    .dev = NESTEDSET_VERSION_DEV,
};

}  // namespace nestedset
