/*
 * dailies C++17 - Org Document Builder Implementation
 */
#include <dailies/org/builder.hpp>
#include <dailies/org/markup.hpp>
#include <dailies/org/properties.hpp>
#include <dailies/core/logger.hpp>
#include <dailies/core/utils.hpp>

namespace dailies {

BuildOptions BuildOptions::from_config(const Config& cfg) {
    BuildOptions o;
    o.max_iterations = static_cast<int>(cfg.get_int("builder.max_iterations", o.max_iterations));
    o.heading_offset = static_cast<int>(cfg.get_int("builder.heading_offset", o.heading_offset));
    int64_t width = cfg.get_int("builder.max_heading_chars", static_cast<int64_t>(o.max_heading_chars));
    if (width > 0) o.max_heading_chars = static_cast<size_t>(width);
    return o;
}

namespace {

const char* const kDefaultTopic = "Conversation";
const char* const kResponseHeading = "*** Response\n";

// Appends text while keeping a running character count
class BodyWriter {
public:
    BodyWriter() : chars_(0) {}

    void append(const std::string& s) {
        text_ += s;
        chars_ += static_cast<int64_t>(utf8_length(s));
    }

    int64_t position() const { return chars_; }
    const std::string& text() const { return text_; }

private:
    std::string text_;
    int64_t chars_;
};

std::string first_line(const std::string& content) {
    size_t nl = content.find('\n');
    return trim(nl == std::string::npos ? content : content.substr(0, nl));
}

} // anonymous namespace

std::string build_org_body(const std::vector<Conversation>& conversations,
                           const BuildOptions& options,
                           std::vector<Bounds>& response_spans) {
    BodyWriter body;
    response_spans.clear();

    for (size_t c = 0; c < conversations.size(); ++c) {
        const Conversation& conv = conversations[c];
        // "* " with nothing after it would not open a section
        std::string topic = trim(conv.topic);
        if (topic.empty()) topic = kDefaultTopic;

        std::vector<std::pair<std::string, std::string>> drawer;
        drawer.push_back(std::make_pair(std::string(props::TOPIC), topic));
        body.append("* " + topic + "\n");
        body.append(render_property_block(drawer));
        body.append("\n");

        for (size_t m = 0; m < conv.messages.size(); ++m) {
            const Message& msg = conv.messages[m];
            if (msg.role == MessageRole::USER) {
                body.append("** " + truncate_display(first_line(msg.content), options.max_heading_chars) + "\n");
                body.append(msg.content + "\n\n");
            } else {
                body.append(kResponseHeading);
                int64_t start = body.position();
                body.append(markdown_to_org(msg.content, options.heading_offset));
                response_spans.push_back(Bounds(start, body.position()));
                body.append("\n\n");
            }
        }
    }

    return body.text();
}

std::string render_bounds_header(const std::string& bounds) {
    std::vector<std::pair<std::string, std::string>> drawer;
    drawer.push_back(std::make_pair(std::string(props::BOUNDS), bounds));
    return render_property_block(drawer) + "\n";
}

BuildResult build_org_document(const std::vector<Conversation>& conversations,
                               const BuildOptions& options) {
    BuildResult result;

    std::vector<Bounds> spans;
    std::string body = build_org_body(conversations, options, spans);
    if (spans.empty()) {
        result.document = body;
        return result;
    }

    const int max_iterations = options.max_iterations > 0 ? options.max_iterations : 1;
    std::string bounds = encode_bounds(std::vector<Bounds>());
    std::vector<Bounds> absolute;
    result.converged = false;

    for (int pass = 1; pass <= max_iterations; ++pass) {
        result.iterations = pass;
        // Body offsets -> absolute 1-based editor positions
        const int64_t shift = static_cast<int64_t>(utf8_length(render_bounds_header(bounds))) + 1;
        absolute.clear();
        for (size_t i = 0; i < spans.size(); ++i) {
            absolute.push_back(Bounds(spans[i].start + shift, spans[i].end + shift));
        }

        std::string next = encode_bounds(absolute);
        if (next == bounds) {
            result.converged = true;
            break;
        }
        bounds = next;
    }

    if (!result.converged) {
        LOG_WARN("[Builder] GPTEL_BOUNDS did not settle after %d passes; keeping last value",
                 result.iterations);
    } else {
        LOG_DEBUG("[Builder] %zu responses, bounds settled after %d passes",
                  spans.size(), result.iterations);
    }

    result.bounds = bounds;
    result.positions = absolute;
    result.document = render_bounds_header(bounds) + body;
    return result;
}

} // namespace dailies
