#include "Semantic.h"

const char* intent_name(Intent intent){
    switch(intent){
        case Intent::Quit:    return "Quit";
        case Intent::Confirm: return "Confirm";
        case Intent::Back:    return "Back";
        case Intent::Up:      return "Up";
        case Intent::Down:    return "Down";
        case Intent::Noop:    return "Noop";
    }
    return "?";
}

Intent decode_key(const KeyEvent& ev){
    if(ev.code == keys::Lost) return Intent::Quit;
    // some terminals send both press and release for one key
    if(ev.kind != KeyKind::Press) return Intent::Noop;

    switch(ev.code){
        case 'q':
        case keys::Escape:
            return Intent::Quit;
        case keys::Enter:
        case '\r':
            return Intent::Confirm;
        case keys::Backspace:
        case 8:  // ^H
            return Intent::Back;
        case keys::Up:
        case 'k':
            return Intent::Up;
        case keys::Down:
        case 'j':
            return Intent::Down;
        default:
            return Intent::Noop;
    }
}

void apply_intent(WizardSession& session, Intent intent){
    switch(intent){
        case Intent::Quit:    session.quit(); break;
        case Intent::Confirm: session.advance(); break;
        case Intent::Back:    session.go_back(); break;
        case Intent::Up:      session.move_cursor_up(); break;
        case Intent::Down:    session.move_cursor_down(); break;
        case Intent::Noop:    break;
    }
}

Intent ScriptedIntentSource::next_intent(){
    if(pos_ >= events_.size()) return Intent::Quit;
    return decode_key(events_[pos_++]);
}

void drive_wizard(WizardSession& session, IntentSource& source,
                  const std::function<void(const WizardSession&)>& on_frame){
    while(!session.finished()){
        if(on_frame) on_frame(session);
        Intent intent = source.next_intent();
        TRACE_LOOP("wizard", "step=", step_name(session.current_step()), ", intent=", intent_name(intent));
        apply_intent(session, intent);
    }
}
