#include "ui/styledebugger.h"
#include "ui/documenttabwidget.h"
#include "theme/thememanager.h"

#include <QApplication>
#include <QCheckBox>
#include <QComboBox>
#include <QDebug>
#include <QHBoxLayout>
#include <QLabel>
#include <QPainter>
#include <QPixmap>
#include <QPushButton>
#include <QTextEdit>
#include <QVBoxLayout>

StyleDebugger::StyleDebugger(QWidget *parent) : QMainWindow(parent)
{
    setupUI();
    setWindowTitle("Tab Bar Style Debugger");
    resize(900, 640);

    connect(ThemeManager::instance(), &ThemeManager::themeChanged, this, &StyleDebugger::updateReport);
    updateReport();
}

void StyleDebugger::setupUI()
{
    QWidget *central = new QWidget(this);
    setCentralWidget(central);

    QVBoxLayout *layout = new QVBoxLayout(central);

    // Live tab widget with a few documents
    m_tabWidget = new DocumentTabWidget();
    for (int i = 1; i <= 5; i++) {
        QLabel *label = new QLabel(QString("Content for Diagram %1").arg(i));
        label->setAlignment(Qt::AlignCenter);
        m_tabWidget->addDocument(label, QString("Diagram %1").arg(i));
    }
    layout->addWidget(m_tabWidget, 1);

    // State picker
    QWidget *picker = new QWidget();
    QHBoxLayout *pickerLayout = new QHBoxLayout(picker);
    pickerLayout->setContentsMargins(0, 0, 0, 0);

    m_typeCombo = new QComboBox();
    m_typeCombo->addItem("Tab", static_cast<int>(WidgetType::Tab));
    m_typeCombo->addItem("Close button", static_cast<int>(WidgetType::CloseButton));
    m_typeCombo->addItem("Tab bar", static_cast<int>(WidgetType::TabBar));

    m_positionCombo = new QComboBox();
    m_positionCombo->addItem("First", static_cast<int>(WidgetState::First));
    m_positionCombo->addItem("Middle", static_cast<int>(WidgetState::Middle));
    m_positionCombo->addItem("Last", static_cast<int>(WidgetState::Last));
    m_positionCombo->addItem("Only one", static_cast<int>(WidgetState::OnlyOne));

    m_bottomCheck = new QCheckBox("Bottom");
    m_selectedCheck = new QCheckBox("Selected");
    m_selectedCheck->setChecked(true);
    m_hoverCheck = new QCheckBox("Hover");
    m_focusCheck = new QCheckBox("Focus");

    pickerLayout->addWidget(m_typeCombo);
    pickerLayout->addWidget(m_positionCombo);
    pickerLayout->addWidget(m_bottomCheck);
    pickerLayout->addWidget(m_selectedCheck);
    pickerLayout->addWidget(m_hoverCheck);
    pickerLayout->addWidget(m_focusCheck);
    pickerLayout->addStretch(1);

    m_swatch = new QLabel();
    m_swatch->setFixedSize(160, 28);
    m_swatch->setFrameShape(QFrame::Box);
    pickerLayout->addWidget(m_swatch);

    layout->addWidget(picker);

    connect(m_typeCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &StyleDebugger::updateReport);
    connect(m_positionCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &StyleDebugger::updateReport);
    for (QCheckBox *box : { m_bottomCheck, m_selectedCheck, m_hoverCheck, m_focusCheck }) {
        connect(box, &QCheckBox::toggled, this, &StyleDebugger::updateReport);
    }
    connect(m_bottomCheck, &QCheckBox::toggled, m_tabWidget, &DocumentTabWidget::setTabsAtBottom);

    // Control buttons
    QWidget *controls = new QWidget();
    QHBoxLayout *controlLayout = new QHBoxLayout(controls);
    controlLayout->setContentsMargins(0, 0, 0, 0);

    QPushButton *reloadBtn = new QPushButton("Reload Theme");
    connect(reloadBtn, &QPushButton::clicked, this, &StyleDebugger::reloadTheme);

    QPushButton *debugBtn = new QPushButton("Check Style Conflicts");
    connect(debugBtn, &QPushButton::clicked, this, &StyleDebugger::checkStyleConflicts);

    QPushButton *forceBtn = new QPushButton("Force Style Refresh");
    connect(forceBtn, &QPushButton::clicked, this, &StyleDebugger::forceStyleApplication);

    controlLayout->addWidget(reloadBtn);
    controlLayout->addWidget(debugBtn);
    controlLayout->addWidget(forceBtn);
    controlLayout->addStretch(1);
    layout->addWidget(controls);

    // Debug output
    m_debugOutput = new QTextEdit();
    m_debugOutput->setReadOnly(true);
    m_debugOutput->setLineWrapMode(QTextEdit::NoWrap);
    m_debugOutput->setMinimumHeight(220);
    layout->addWidget(m_debugOutput);
}

WidgetState StyleDebugger::pickedState() const
{
    const WidgetType type = static_cast<WidgetType>(m_typeCombo->currentData().toInt());
    WidgetState::Flags flags = m_bottomCheck->isChecked() ? WidgetState::Bottom : WidgetState::Top;

    if (type == WidgetType::Tab) {
        flags |= static_cast<WidgetState::Flag>(m_positionCombo->currentData().toInt());
        if (m_selectedCheck->isChecked()) flags |= WidgetState::Selected;
        if (m_focusCheck->isChecked()) flags |= WidgetState::Focus;
    }
    if (type != WidgetType::TabBar && m_hoverCheck->isChecked()) flags |= WidgetState::Hover;
    return WidgetState(type, flags);
}

QString StyleDebugger::describe(const StyleRuleTable &table, const WidgetState &state)
{
    QString out;
    out += QString("State: %1\n\n").arg(state.toString());

    const QList<StyleRule> matched = table.matchingRules(state);
    if (matched.isEmpty()) {
        out += "No rule matches; toolkit defaults apply.\n";
        return out;
    }

    out += "Matching rules, in cascade order:\n";
    for (const StyleRule &rule : matched) {
        out += QString("  [%1] %2\n").arg(rule.selector.specificity(), 3).arg(rule.selector.toString());
    }

    out += "\nResolved properties:\n";
    out += table.resolve(state).toString("  ");
    return out;
}

QString StyleDebugger::reportText() const
{
    return m_debugOutput->toPlainText();
}

void StyleDebugger::updateReport()
{
    const WidgetType type = static_cast<WidgetType>(m_typeCombo->currentData().toInt());
    m_positionCombo->setEnabled(type == WidgetType::Tab);
    m_selectedCheck->setEnabled(type == WidgetType::Tab);
    m_focusCheck->setEnabled(type == WidgetType::Tab);
    m_hoverCheck->setEnabled(type != WidgetType::TabBar);

    const StyleRuleTable &table = ThemeManager::instance()->table();
    const WidgetState state = pickedState();
    m_debugOutput->setPlainText(describe(table, state));
    updateSwatch(table.resolve(state));
}

void StyleDebugger::updateSwatch(const PropertySet &resolved)
{
    QPixmap pixmap(m_swatch->size());
    pixmap.fill(Qt::transparent);

    const PropertyValue background = resolved.value("background");
    if (background.kind() == PropertyValue::Gradient || background.kind() == PropertyValue::Color) {
        QPainter painter(&pixmap);
        const QBrush brush = background.kind() == PropertyValue::Gradient
            ? QBrush(background.toGradient().toLinearGradient())
            : QBrush(background.toColor());
        painter.fillRect(pixmap.rect(), brush);
    }
    m_swatch->setPixmap(pixmap);
    m_swatch->setToolTip(background.isValid() ? background.toString() : QString("toolkit default"));
}

void StyleDebugger::reloadTheme()
{
    ThemeManager *theme = ThemeManager::instance();
    if (theme->isBuiltIn()) {
        if (!theme->loadConfigured()) {
            m_debugOutput->append("Configured style sheet unavailable, using the built-in theme");
        }
    } else {
        QString error;
        if (!theme->load(theme->sourcePath(), &error)) {
            m_debugOutput->append(QString("Reload failed: %1").arg(error));
            return;
        }
    }
    theme->apply(qApp);

    for (const QString &warning : theme->parseWarnings()) {
        m_debugOutput->append("Warning: " + warning);
    }
    for (const ThemeIssue &issue : theme->issues()) {
        m_debugOutput->append("Issue: " + issue.toString());
    }
}

void StyleDebugger::checkStyleConflicts()
{
    m_tabWidget->debugStyleConflicts();

    m_debugOutput->append("=== STYLE DEBUGGING INFO ===");
    m_debugOutput->append(QString("Application Style: %1").arg(QApplication::style()->objectName()));

    const QString globalSheet = qApp->styleSheet();
    if (globalSheet.isEmpty()) {
        m_debugOutput->append("Global Stylesheet: NONE");
    } else {
        m_debugOutput->append(QString("Global Stylesheet: %1 characters").arg(globalSheet.length()));
    }

    for (int i = 0; i < m_tabWidget->count(); ++i) {
        m_debugOutput->append(QString("Tab %1: %2").arg(i).arg(m_tabWidget->tabState(i).toString()));
    }
    m_debugOutput->append("=== END DEBUG INFO ===");
}

void StyleDebugger::forceStyleApplication()
{
    m_tabWidget->forceStyleRefresh();
    m_debugOutput->append("Forced style refresh (unpolish + polish)");
}
