#ifndef STYLEDEBUGGER_H
#define STYLEDEBUGGER_H

#include "theme/styleruletable.h"

#include <QMainWindow>

class QCheckBox;
class QComboBox;
class QLabel;
class QTextEdit;
class DocumentTabWidget;

// Preview window for the tab bar theme: a live document tab widget, a state
// picker, and the rules and merged properties the theme resolves for the
// picked state.
class StyleDebugger : public QMainWindow
{
    Q_OBJECT

public:
    explicit StyleDebugger(QWidget *parent = nullptr);

    // State described by the picker controls
    WidgetState pickedState() const;
    // Report shown in the output panel for a state
    static QString describe(const StyleRuleTable &table, const WidgetState &state);

    DocumentTabWidget *tabWidget() const { return m_tabWidget; }
    QString reportText() const;

public slots:
    void updateReport();
    void reloadTheme();
    void checkStyleConflicts();
    void forceStyleApplication();

private:
    void setupUI();
    void updateSwatch(const PropertySet &resolved);

    DocumentTabWidget *m_tabWidget = nullptr;
    QComboBox *m_typeCombo = nullptr;
    QComboBox *m_positionCombo = nullptr;
    QCheckBox *m_bottomCheck = nullptr;
    QCheckBox *m_selectedCheck = nullptr;
    QCheckBox *m_hoverCheck = nullptr;
    QCheckBox *m_focusCheck = nullptr;
    QLabel *m_swatch = nullptr;
    QTextEdit *m_debugOutput = nullptr;
};

#endif // STYLEDEBUGGER_H
