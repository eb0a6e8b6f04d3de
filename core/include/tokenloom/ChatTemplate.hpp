/**
 * @file ChatTemplate.hpp
 * @brief Chat history -> prompt text (ChatML, Llama [INST], Phi-3)
 *
 * A ChatTemplate is chosen once, when a conversation is constructed, and
 * is then a plain function pointer; rendering a turn does not re-dispatch
 * on the format.
 */

#ifndef TL_CHAT_TEMPLATE_HPP
#define TL_CHAT_TEMPLATE_HPP

#include <string>
#include <string_view>
#include <vector>

namespace tl {

enum class ChatRole { SYSTEM, USER, ASSISTANT };

struct ChatMessage {
    ChatRole    role;
    std::string content;
};

enum class ChatFormat {
    CHATML,     /* <|im_start|>role\ncontent<|im_end|> */
    LLAMA,      /* [INST] ... [/INST] */
    PHI3,       /* <|user|>\ncontent<|end|> */
    AUTO        /* from the model name */
};

inline const char* chat_role_str(ChatRole r) {
    switch (r) {
        case ChatRole::SYSTEM:    return "system";
        case ChatRole::USER:      return "user";
        case ChatRole::ASSISTANT: return "assistant";
    }
    return "user";
}

inline const char* chat_format_str(ChatFormat f) {
    switch (f) {
        case ChatFormat::CHATML: return "chatml";
        case ChatFormat::LLAMA:  return "llama";
        case ChatFormat::PHI3:   return "phi3";
        case ChatFormat::AUTO:   return "auto";
    }
    return "chatml";
}

/** Substring match on the model name; ChatML when nothing matches. */
inline ChatFormat detect_chat_format(std::string_view model_name) {
    auto has = [&](std::string_view s) {
        return model_name.find(s) != std::string_view::npos;
    };
    if (has("llama") || has("mistral") || has("mixtral")) return ChatFormat::LLAMA;
    if (has("phi"))                                        return ChatFormat::PHI3;
    return ChatFormat::CHATML;
}

/* ================================================================== */
/*  Renderers                                                          */
/* ================================================================== */

inline std::string render_chatml(const std::vector<ChatMessage>& messages) {
    std::string out;
    for (const auto& m : messages) {
        out += "<|im_start|>";
        out += chat_role_str(m.role);
        out += '\n';
        out += m.content;
        out += "<|im_end|>\n";
    }
    out += "<|im_start|>assistant\n";
    return out;
}

/** System text goes in a <<SYS>> block inside the first [INST]. */
inline std::string render_llama(const std::vector<ChatMessage>& messages) {
    std::string out;
    std::string system;
    bool first_user = true;
    for (const auto& m : messages) {
        switch (m.role) {
            case ChatRole::SYSTEM:
                system = m.content;
                break;
            case ChatRole::USER:
                out += "[INST] ";
                if (first_user && !system.empty())
                    out += "<<SYS>>\n" + system + "\n<</SYS>>\n\n";
                out += m.content;
                out += " [/INST]";
                first_user = false;
                break;
            case ChatRole::ASSISTANT:
                out += ' ';
                out += m.content;
                out += ' ';
                break;
        }
    }
    return out;
}

inline std::string render_phi3(const std::vector<ChatMessage>& messages) {
    std::string out;
    for (const auto& m : messages) {
        out += "<|";
        out += chat_role_str(m.role);
        out += "|>\n";
        out += m.content;
        out += "<|end|>\n";
    }
    out += "<|assistant|>\n";
    return out;
}

/* ================================================================== */
/*  ChatTemplate                                                       */
/* ================================================================== */

class ChatTemplate {
public:
    using RenderFn = std::string (*)(const std::vector<ChatMessage>&);

    /** AUTO resolves against `model_name` here, once. */
    static ChatTemplate select(ChatFormat format, std::string_view model_name) {
        if (format == ChatFormat::AUTO) format = detect_chat_format(model_name);
        switch (format) {
            case ChatFormat::LLAMA: return ChatTemplate(format, &render_llama, "[INST]");
            case ChatFormat::PHI3:  return ChatTemplate(format, &render_phi3, "<|end|>");
            default:                return ChatTemplate(ChatFormat::CHATML, &render_chatml,
                                                        "<|im_end|>");
        }
    }

    ChatFormat format() const { return format_; }

    std::string render(const std::vector<ChatMessage>& messages) const {
        return render_(messages);
    }

    /** Marker that ends an assistant turn in this format. */
    const char* turn_end() const { return turn_end_; }

private:
    ChatTemplate(ChatFormat f, RenderFn fn, const char* turn_end)
        : format_(f), render_(fn), turn_end_(turn_end) {}

    ChatFormat  format_;
    RenderFn    render_;
    const char* turn_end_;
};

} // namespace tl

#endif // TL_CHAT_TEMPLATE_HPP
