#ifndef WEB_LOGIN_SCRIPTS_HPP
#define WEB_LOGIN_SCRIPTS_HPP

namespace BalanceMonitor {
namespace WebCheck {
namespace Scripts {

constexpr const char* LOGIN_ERROR_TEXT = R"JS(
    const selectors = ['.error-message', '.alert-danger', '.toast-error', '[role="alert"]'];
    for (const selector of selectors) {
        const node = document.querySelector(selector);
        if (!node) continue;
        const text = (node.innerText || node.textContent || '').trim();
        if (text) return text;
    }
    return '';
)JS";

constexpr const char* CLOSE_ANNOUNCEMENT_POPUP = R"JS(
    const closeBtn = document.querySelector('.semi-modal-close');
    if (closeBtn && closeBtn.offsetParent !== null) {
        closeBtn.click();
        return true;
    }
    const buttons = Array.from(document.querySelectorAll('button'));
    for (const btn of buttons) {
        const text = (btn.textContent || '').trim();
        if (text.includes('今日关闭') || text.includes('关闭公告') || text.includes('关闭') || text === 'Close') {
            btn.click();
            return true;
        }
    }
    return false;
)JS";

constexpr const char* CLICK_ARGUMENT = "arguments[0].click(); return true;";

constexpr const char* SKELETON_GONE = "return !document.querySelector('.semi-skeleton');";

constexpr const char* EXTRACT_BALANCE = R"JS(
    const money = /\$\s*([\d,]+\.?\d*)/;
    const known = ['.balance-amount', '[data-balance]', '.user-balance', '.wallet-balance'];
    for (const selector of known) {
        for (const elem of document.querySelectorAll(selector)) {
            const m = String(elem.textContent || '').match(money);
            if (m) return '$' + m[1];
        }
    }
    const labels = ['当前余额', 'Current Balance', '余额', 'Balance'];
    for (const label of labels) {
        const result = document.evaluate(`//*[contains(text(), '${label}')]`, document, null,
                                         XPathResult.FIRST_ORDERED_NODE_TYPE, null);
        const node = result.singleNodeValue;
        if (!node || !node.parentElement) continue;
        const m = String(node.parentElement.textContent || '').match(money);
        if (m) return '$' + m[1];
    }
    const body = (document.body && document.body.innerText) ? document.body.innerText : '';
    const m = body.match(/(?:当前余额|余额|Balance)[：:\s]*\$([\d,]+\.?\d*)/i);
    return m ? '$' + m[1] : '';
)JS";

constexpr const char* PAGE_SNIPPET = R"JS(
    const body = (document.body && document.body.innerText) || '';
    return body.substring(0, 300).replace(/\s+/g, ' ');
)JS";

} // namespace Scripts
} // namespace WebCheck
} // namespace BalanceMonitor

#endif // WEB_LOGIN_SCRIPTS_HPP
