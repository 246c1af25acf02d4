#ifndef _Semantic_input_h_
#define _Semantic_input_h_

enum class Intent { Quit, Confirm, Back, Up, Down, Noop };

const char* intent_name(Intent intent);

// Key codes independent of the terminal library; printable keys use their char value.
namespace keys {
    constexpr int Enter     = '\n';
    constexpr int Escape    = 27;
    constexpr int Backspace = 127;
    constexpr int Up        = 0x1001;
    constexpr int Down      = 0x1002;
    constexpr int None      = -1;
    constexpr int Lost      = -2;  // input device gone (hangup, read error)
}

// Terminals may report repeats and releases in addition to the press.
enum class KeyKind { Press, Repeat, Release };

struct KeyEvent {
    int code = keys::None;
    KeyKind kind = KeyKind::Press;
};

// Only presses produce intents; everything unmapped is Noop.
// A lost input device always quits.
Intent decode_key(const KeyEvent& ev);

// Apply exactly one session operation for an intent.
void apply_intent(WizardSession& session, Intent intent);

// Blocking pull of the next intent.
struct IntentSource {
    virtual ~IntentSource() = default;
    virtual Intent next_intent() = 0;
};

// Replays a fixed list of key events, then reports Quit.
class ScriptedIntentSource : public IntentSource {
public:
    explicit ScriptedIntentSource(std::vector<KeyEvent> events) : events_(std::move(events)) {}
    Intent next_intent() override;
    size_t remaining() const { return events_.size() - pos_; }

private:
    std::vector<KeyEvent> events_;
    size_t pos_ = 0;
};

// Pull intents until the session is finished. on_frame runs before every read.
void drive_wizard(WizardSession& session, IntentSource& source,
                  const std::function<void(const WizardSession&)>& on_frame = {});

#endif
