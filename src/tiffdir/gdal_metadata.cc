#include "tiffdir/gdal_metadata.h"

#include <cstddef>
#include <cstdint>
#include <utility>

#if defined(TIFFDIR_HAS_EXPAT) && TIFFDIR_HAS_EXPAT
#    include <expat.h>
#endif

namespace tiffdir {
namespace {

#if defined(TIFFDIR_HAS_EXPAT) && TIFFDIR_HAS_EXPAT

    struct Ctx final {
        XML_Parser parser = nullptr;
        GdalMetadataLimits limits;
        GdalMetadataStatus status = GdalMetadataStatus::Ok;

        uint32_t depth = 0;
        bool in_item   = false;
        GdalMetadataItem item;
        std::vector<GdalMetadataItem> items;
    };

    static void stop_parser(Ctx* ctx, GdalMetadataStatus status) noexcept
    {
        if (ctx->status == GdalMetadataStatus::Ok) {
            ctx->status = status;
        }
        XML_StopParser(ctx->parser, XML_FALSE);
    }


    static bool parse_sample(std::string_view s, int32_t* out) noexcept
    {
        if (s.empty() || s.size() > 9U) {
            return false;
        }
        int32_t v = 0;
        for (const char c : s) {
            if (c < '0' || c > '9') {
                return false;
            }
            v = v * 10 + (c - '0');
        }
        *out = v;
        return true;
    }


    static void XMLCALL start_element(void* user_data, const XML_Char* name_c,
                                      const XML_Char** atts)
    {
        Ctx* ctx = reinterpret_cast<Ctx*>(user_data);
        if (ctx->status != GdalMetadataStatus::Ok) {
            return;
        }
        const std::string_view name(name_c);
        ctx->depth += 1;

        if (ctx->depth == 1U) {
            if (name != "GDALMetadata") {
                stop_parser(ctx, GdalMetadataStatus::Malformed);
            }
            return;
        }
        if (ctx->depth != 2U || name != "Item") {
            return;
        }

        if (ctx->limits.max_items != 0U
            && ctx->items.size() >= ctx->limits.max_items) {
            stop_parser(ctx, GdalMetadataStatus::LimitExceeded);
            return;
        }

        ctx->in_item = true;
        ctx->item    = GdalMetadataItem {};
        for (size_t i = 0; atts && atts[i] && atts[i + 1]; i += 2) {
            const std::string_view key(atts[i]);
            const std::string_view val(atts[i + 1]);
            if (key == "name") {
                ctx->item.name.assign(val.data(), val.size());
            } else if (key == "domain") {
                ctx->item.domain.assign(val.data(), val.size());
            } else if (key == "role") {
                ctx->item.role.assign(val.data(), val.size());
            } else if (key == "sample") {
                if (!parse_sample(val, &ctx->item.sample)) {
                    stop_parser(ctx, GdalMetadataStatus::Malformed);
                    return;
                }
            }
        }
        if (ctx->item.name.empty()) {
            stop_parser(ctx, GdalMetadataStatus::Malformed);
        }
    }


    static void XMLCALL end_element(void* user_data, const XML_Char* /*name_c*/)
    {
        Ctx* ctx = reinterpret_cast<Ctx*>(user_data);
        if (ctx->status != GdalMetadataStatus::Ok) {
            return;
        }
        if (ctx->depth == 2U && ctx->in_item) {
            ctx->in_item = false;
            ctx->items.push_back(std::move(ctx->item));
        }
        ctx->depth -= 1;
    }


    static void XMLCALL char_data(void* user_data, const XML_Char* s, int len)
    {
        Ctx* ctx = reinterpret_cast<Ctx*>(user_data);
        if (ctx->status != GdalMetadataStatus::Ok || !ctx->in_item
            || ctx->depth != 2U || len <= 0) {
            return;
        }
        const uint32_t max_val = ctx->limits.max_value_bytes;
        const size_t have      = ctx->item.value.size();
        if (max_val != 0U && have + static_cast<size_t>(len) > max_val) {
            stop_parser(ctx, GdalMetadataStatus::LimitExceeded);
            return;
        }
        ctx->item.value.append(s, static_cast<size_t>(len));
    }

#endif  // TIFFDIR_HAS_EXPAT

}  // namespace

bool
gdal_metadata_available() noexcept
{
#if defined(TIFFDIR_HAS_EXPAT) && TIFFDIR_HAS_EXPAT
    return true;
#else
    return false;
#endif
}


std::string_view
gdal_metadata_status_name(GdalMetadataStatus status) noexcept
{
    switch (status) {
    case GdalMetadataStatus::Ok: return "ok";
    case GdalMetadataStatus::Unsupported: return "unsupported";
    case GdalMetadataStatus::Malformed: return "malformed";
    case GdalMetadataStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}


GdalMetadataStatus
parse_gdal_metadata(std::string_view xml, const GdalMetadataLimits& limits,
                    std::vector<GdalMetadataItem>* out) noexcept
{
    if (xml.find('<') == std::string_view::npos) {
        return GdalMetadataStatus::Unsupported;
    }
    if (limits.max_input_bytes != 0U && xml.size() > limits.max_input_bytes) {
        return GdalMetadataStatus::LimitExceeded;
    }
    if (xml.size() > static_cast<size_t>(INT32_MAX)) {
        return GdalMetadataStatus::LimitExceeded;
    }

#if defined(TIFFDIR_HAS_EXPAT) && TIFFDIR_HAS_EXPAT
    Ctx ctx;
    ctx.limits = limits;
    ctx.parser = XML_ParserCreate(nullptr);
    if (!ctx.parser) {
        return GdalMetadataStatus::Malformed;
    }

    XML_SetUserData(ctx.parser, &ctx);
    XML_SetElementHandler(ctx.parser, &start_element, &end_element);
    XML_SetCharacterDataHandler(ctx.parser, &char_data);

    const XML_Status st = XML_Parse(ctx.parser, xml.data(),
                                    static_cast<int>(xml.size()), XML_TRUE);
    if (st == XML_STATUS_ERROR && ctx.status == GdalMetadataStatus::Ok) {
        ctx.status = GdalMetadataStatus::Malformed;
    }
    XML_ParserFree(ctx.parser);
    ctx.parser = nullptr;

    if (ctx.status != GdalMetadataStatus::Ok) {
        return ctx.status;
    }
    if (out) {
        *out = std::move(ctx.items);
    }
    return GdalMetadataStatus::Ok;
#else
    (void)out;
    return GdalMetadataStatus::Unsupported;
#endif
}

}  // namespace tiffdir
