#include "layout_chunker/qa_reconstructor.h"
#include "layout_chunker/text_utils.h"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace layout_chunker {

std::string QaUnit::question() const {
    std::string joined;
    for (size_t i = 0; i < heading_path.size(); ++i) {
        if (i > 0) joined += "\n";
        joined += heading_path[i];
    }
    return joined;
}

std::string QaUnit::text() const {
    return question() + "\n" + answer;
}

QaReconstructor::QaReconstructor(VisionModel* vision, std::string image_prompt)
    : vision_(vision), image_prompt_(std::move(image_prompt)) {}

int QaReconstructor::heading_level(const std::string& style_name) {
    std::string name = text::to_lower(text::trim(style_name));
    const std::string prefix = "heading";
    if (name.compare(0, prefix.size(), prefix) != 0) {
        return 0;
    }

    std::string number = text::trim(name.substr(prefix.size()));
    if (number.empty() || number.size() > 3 ||
        !std::all_of(number.begin(), number.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return 0;
    }
    return std::stoi(number);
}

std::vector<QaUnit> QaReconstructor::reconstruct(const std::vector<Paragraph>& paragraphs,
                                                 int from_page, int to_page) const {
    Context ctx;

    for (const auto& paragraph : paragraphs) {
        if (ctx.page > to_page) {
            break;
        }

        // Outside the window only embedded pictures are still collected
        std::string text;
        int level = 0;
        if (from_page <= ctx.page && ctx.page < to_page) {
            text = text::normalize_heading(paragraph.text);
            level = text.empty() ? 0 : heading_level(paragraph.style_name);
        }

        if (level == 0 || level > kMaxHeadingLevel) {
            append_body(ctx, text, paragraph.image);
        } else {
            open_heading(ctx, text, level);
        }

        ctx.page += paragraph.page_breaks;
    }

    if (!ctx.answer.empty()) {
        flush(ctx);
    }

    return std::move(ctx.units);
}

void QaReconstructor::append_body(Context& ctx, const std::string& text,
                                  const std::optional<Image>& image) const {
    auto append_line = [&ctx](const std::string& line) {
        if (!ctx.answer.empty()) ctx.answer += "\n";
        ctx.answer += line;
    };

    if (!text.empty()) {
        append_line(text);
    }

    if (!image) {
        return;
    }

    if (vision_) {
        try {
            std::string description = vision_->describe(*image, image_prompt_);
            append_line("[Image Content]: " + description);
            return;
        } catch (const std::exception& e) {
            std::cerr << "[QaReconstructor::append_body] Warning: vision model error: "
                      << e.what() << ". Using original image." << std::endl;
        }
    }

    ctx.pending_image = concat_images(ctx.pending_image, image);
}

void QaReconstructor::open_heading(Context& ctx, const std::string& text, int level) const {
    if (!ctx.answer.empty() || ctx.pending_image) {
        flush(ctx);
    }

    while (!ctx.stack.empty() && level <= ctx.stack.back().second) {
        ctx.stack.pop_back();
    }
    ctx.stack.emplace_back(text, level);
}

void QaReconstructor::flush(Context& ctx) const {
    // Content ahead of the first heading has no question to attach to
    if (!ctx.stack.empty()) {
        QaUnit unit;
        unit.heading_path.reserve(ctx.stack.size());
        for (const auto& entry : ctx.stack) {
            unit.heading_path.push_back(entry.first);
        }
        unit.answer = std::move(ctx.answer);
        unit.image = std::move(ctx.pending_image);
        ctx.units.push_back(std::move(unit));
    }

    ctx.answer.clear();
    ctx.pending_image.reset();
}

} // namespace layout_chunker
